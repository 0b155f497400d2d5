// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#include "MetaRegistry.h"
#include "MetaNode.h"

// metagraph
#include <metagraph/Errors.h>
#include <metagraph/attribute/AttributeUtils.h>
#include <metagraph/internal/internal_utils.h>
#include <metagraph/logging/MetaGraphLogging.h>

// stl
#include <algorithm>

// System
#include <dlfcn.h>

namespace {

MgLogSetup("MetaRegistry");

using RegisterTypesFn = bool(metagraph::MetaRegistry&);

const char* kRegisterTypesSymbol = "metagraphRegisterTypes";

} // anonymous namespace

namespace metagraph {

MetaRegistry::MetaRegistry()
    : MetaRegistry(Options())
{
}

MetaRegistry::MetaRegistry(const Options& options)
    : mOptions(options)
{
    registerType<MetaNode>();
}

MetaRegistry::~MetaRegistry()
{
}

bool
MetaRegistry::registerType(const std::string& typeName, Creator creator)
{
    if (typeName.empty() || !creator) {
        MgLogError("Cannot register a meta type without a name and a creator");
        return false;
    }

    const bool inserted = mCreators.emplace(typeName, std::move(creator)).second;
    if (inserted) {
        MgLogDebug("Registered meta type '" << typeName << "'");
    }

    return inserted;
}

bool
MetaRegistry::isRegistered(const std::string& typeName) const
{
    return mCreators.find(typeName) != mCreators.end();
}

std::vector<std::string>
MetaRegistry::typeNames() const
{
    std::vector<std::string> result;
    for (const auto& entry : mCreators) {
        result.push_back(entry.first);
    }

    std::sort(result.begin(), result.end());
    return result;
}

std::shared_ptr<MetaNode>
MetaRegistry::fromTag(const std::string& tag, const NodeHandle& node) const
{
    const auto it = mCreators.find(tag);
    if (it == mCreators.end()) {
        return nullptr;
    }

    std::shared_ptr<MetaNode> metaNode = it->second(*this);
    if (node.isBound()) {
        metaNode->bind(node);
    }

    return metaNode;
}

std::shared_ptr<MetaNode>
MetaRegistry::create(const std::string& typeName,
                     Scene& scene,
                     const std::string& name) const
{
    std::shared_ptr<MetaNode> metaNode = fromTag(typeName);
    if (!metaNode) {
        throw MetaGraphError("Meta type '" + typeName + "' is not registered");
    }

    const std::string nodeName = (name.empty() ? typeName : name) + "_meta";

    Modifier modifier(scene);
    const NodeHandle node = modifier.createNode(metaNode->hostNodeType(), nodeName);
    metaNode->queueInitialize(modifier, node, true);
    modifier.doIt();

    metaNode->bind(node);
    return metaNode;
}

std::shared_ptr<MetaNode>
MetaRegistry::construct(const NodeHandle& node,
                        const std::string& requestedType,
                        bool initialize) const
{
    // stale handles fail here
    node.data();

    std::string tag = requestedType.empty() ? MetaNode::kTypeName : requestedType;

    const Plug classPlug(node, MetaNode::kClassAttr);
    if (classPlug.isValid()) {
        const std::string storedTag = stringValue(classPlug.value());
        if (storedTag != tag) {
            if (isRegistered(storedTag)) {
                tag = storedTag;
            } else {
                MgLogDebug("'" << node.name() << "' is tagged '" << storedTag
                           << "' which is not registered, using '" << tag << "'");
            }
        }
    }

    std::shared_ptr<MetaNode> metaNode = fromTag(tag, node);
    if (!metaNode) {
        MgLogWarn("Meta type '" << tag << "' is not registered, using "
                  << MetaNode::kTypeName);
        metaNode = fromTag(MetaNode::kTypeName, node);
    }

    if (initialize && metaNode->state() == MetaNode::State::BOUND_UNINITIALIZED) {
        metaNode->initialize(true);
    }

    return metaNode;
}

std::size_t
MetaRegistry::scan(const std::vector<std::string>& directories)
{
    std::lock_guard<std::mutex> lock(mLibraryMutex);

    std::size_t loadedCount = 0;
    for (const std::string& directory : directories) {
        for (const std::string& libraryPath : internal::listSharedLibraries(directory)) {
            if (mLoadedLibraries.count(libraryPath) > 0) {
                continue;
            }

            // libraries stay open, their creators live in the registry
            void* dso = ::dlopen(libraryPath.c_str(), RTLD_LOCAL | RTLD_NOW);
            if (!dso) {
                MgLogError("Could not open '" << libraryPath << "': " << ::dlerror());
                continue;
            }

            auto* registerTypes =
                    reinterpret_cast<RegisterTypesFn*>(::dlsym(dso, kRegisterTypesSymbol));
            if (!registerTypes) {
                MgLogDebug("'" << libraryPath << "' has no " << kRegisterTypesSymbol);
                ::dlclose(dso);
                continue;
            }

            mLoadedLibraries.insert(libraryPath);
            ++loadedCount;

            bool registered = false;
            try {
                registered = registerTypes(*this);
            } catch (const std::exception& e) {
                MgLogError("'" << libraryPath << "' failed to register its types: " << e.what());
                continue;
            }

            if (!registered) {
                MgLogWarn("'" << libraryPath << "' reported a failure registering its types");
            } else {
                MgLogInfo("Loaded meta types from '" << libraryPath << "'");
            }
        }
    }

    return loadedCount;
}

std::size_t
MetaRegistry::scanSearchPath(const std::string& searchPath)
{
    return scan(internal::splitString(searchPath, ':'));
}

} // namespace metagraph

