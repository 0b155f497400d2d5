// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#include "Scene.h"
#include "SceneInternal.h"

// metagraph
#include <metagraph/Errors.h>
#include <metagraph/logging/MetaGraphLogging.h>

// stl
#include <algorithm>
#include <cctype>

namespace {

MgLogSetup("Scene");

} // anonymous namespace

namespace metagraph {

//=============================================================================
// NodeHandle
//=============================================================================
NodeHandle::NodeHandle(Scene* scene, const std::shared_ptr<internal::NodeData>& data)
    : mScene(scene)
    , mData(data)
    , mId(data ? data->id : 0)
{
}

bool
NodeHandle::isValid() const
{
    const auto node = mData.lock();
    return node && node->alive;
}

std::shared_ptr<internal::NodeData>
NodeHandle::data() const
{
    auto node = mData.lock();
    if (node && node->alive) {
        return node;
    }

    if (node) {
        throw StaleReferenceError::fromNode(node->name);
    }

    throw StaleReferenceError::fromNode("#" + std::to_string(mId));
}

std::string
NodeHandle::name() const
{
    return data()->name;
}

std::string
NodeHandle::typeName() const
{
    return data()->typeName;
}

bool
NodeHandle::isDag() const
{
    return data()->isDag;
}

bool
NodeHandle::isLocked() const
{
    return data()->locked;
}

NodeHandle
NodeHandle::parent() const
{
    const auto parentData = data()->parent.lock();
    if (!parentData || !parentData->alive) {
        return {};
    }

    return NodeHandle(mScene, parentData);
}

std::vector<NodeHandle>
NodeHandle::children() const
{
    std::vector<NodeHandle> result;
    for (const auto& weakChild : data()->children) {
        const auto child = weakChild.lock();
        if (child && child->alive) {
            result.emplace_back(mScene, child);
        }
    }

    return result;
}

std::string
NodeHandle::fullPathName() const
{
    const auto node = data();
    if (!node->isDag) {
        return node->name;
    }

    std::string path;
    for (auto current = node; current; current = current->parent.lock()) {
        path = "|" + current->name + path;
    }

    return path;
}

//=============================================================================
// Scene
//=============================================================================
Scene::Scene()
{
}

Scene::~Scene()
{
    // handles held elsewhere must see the nodes as gone
    for (const auto& node : mNodes) {
        node->alive = false;
        node->connections.clear();
    }
}

void
Scene::registerExtension(const std::string& name, ExtensionLoader loader)
{
    for (auto& extension : mExtensions) {
        if (extension.first == name) {
            extension.second = std::move(loader);
            return;
        }
    }

    mExtensions.emplace_back(name, std::move(loader));
}

bool
Scene::loadExtension(const std::string& name)
{
    if (isExtensionLoaded(name)) {
        return true;
    }

    for (const auto& extension : mExtensions) {
        if (extension.first != name) {
            continue;
        }

        bool loaded = false;
        try {
            loaded = extension.second(mNodeTypes);
        } catch (const std::exception& e) {
            MgLogError("Extension '" << name << "' failed to load: " << e.what());
            return false;
        }

        if (loaded) {
            mLoadedExtensions.insert(name);
            MgLogDebug("Loaded extension '" << name << "'");
        }
        return loaded;
    }

    MgLogDebug("No extension named '" << name << "' is registered");
    return false;
}

bool
Scene::isExtensionLoaded(const std::string& name) const
{
    return mLoadedExtensions.count(name) > 0;
}

NodeHandle
Scene::findNode(const std::string& name) const
{
    const bool isPath = !name.empty() && name[0] == '|';

    for (const auto& node : mNodes) {
        NodeHandle handle(const_cast<Scene*>(this), node);
        if (isPath ? (node->isDag && handle.fullPathName() == name)
                   : (node->name == name)) {
            return handle;
        }
    }

    return {};
}

std::vector<NodeHandle>
Scene::nodes() const
{
    std::vector<NodeHandle> result;
    result.reserve(mNodes.size());
    for (const auto& node : mNodes) {
        result.emplace_back(const_cast<Scene*>(this), node);
    }

    return result;
}

std::string
Scene::uniqueName(const std::string& requested) const
{
    const auto taken = [this](const std::string& candidate) {
        return std::any_of(mNodes.begin(), mNodes.end(),
                           [&](const internal::NodeDataPtr& node) {
                               return node->name == candidate;
                           });
    };

    if (!taken(requested)) {
        return requested;
    }

    // "joint12" becomes "joint13", "joint14", ...
    std::string base = requested;
    while (!base.empty() && std::isdigit(static_cast<unsigned char>(base.back()))) {
        base.pop_back();
    }

    for (uint64_t suffix = 1; ; ++suffix) {
        const std::string candidate = base + std::to_string(suffix);
        if (!taken(candidate)) {
            return candidate;
        }
    }
}

std::shared_ptr<internal::NodeData>
Scene::newNodeData(const NodeType& nodeType, const std::string& name)
{
    auto node = std::make_shared<internal::NodeData>();
    node->scene = this;
    node->id = mNextId++;
    node->name = name;
    node->typeName = nodeType.name;
    node->isDag = nodeType.isDag;

    for (const auto& spec : nodeType.attributes) {
        auto copy = spec->clone();
        copy->isDynamic = false;
        node->attributes.push_back(std::move(copy));
    }

    return node;
}

void
Scene::attachNode(const std::shared_ptr<internal::NodeData>& node)
{
    node->alive = true;
    mNodes.push_back(node);

    if (const auto parent = node->parent.lock()) {
        parent->children.push_back(node);
    }
}

void
Scene::detachNode(const std::shared_ptr<internal::NodeData>& node)
{
    mNodes.erase(std::remove(mNodes.begin(), mNodes.end(), node), mNodes.end());

    if (const auto parent = node->parent.lock()) {
        auto& siblings = parent->children;
        siblings.erase(std::remove_if(siblings.begin(), siblings.end(),
                                      [&](const std::weak_ptr<internal::NodeData>& sibling) {
                                          return sibling.lock() == node;
                                      }),
                       siblings.end());
    }

    node->alive = false;
}

} // namespace metagraph

