// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#include "MetaUtil.h"
#include "MetaRegistry.h"

// metagraph
#include <metagraph/attribute/AttributeUtils.h>
#include <metagraph/logging/MetaGraphLogging.h>
#include <metagraph/node/NodeUtil.h>
#include <metagraph/plug/PlugUtil.h>

// stl
#include <regex>

namespace {

MgLogSetup("MetaUtil");

using namespace metagraph;

template <typename Predicate>
std::vector<Plug>
filterScene(const MetaRegistry& registry,
            const Scene& scene,
            const StringVector& attrNames,
            Predicate matches)
{
    std::vector<Plug> result;
    for (const MetaNode::Ptr& metaNode : meta_util::iterSceneMetaNodes(registry, scene)) {
        for (const std::string& attrName : attrNames) {
            const Plug plug = metaNode->attribute(attrName);
            if (!plug.isNull() && matches(plug_util::getValue(plug))) {
                result.push_back(plug);
            }
        }
    }

    return result;
}

} // anonymous namespace

namespace metagraph {
namespace meta_util {

bool
isMetaNode(const MetaRegistry& registry, const NodeHandle& node)
{
    const Plug classPlug(node, MetaNode::kClassAttr);
    if (!classPlug.isValid()) {
        return false;
    }

    return registry.isRegistered(stringValue(classPlug.value()));
}

std::vector<MetaNode::Ptr>
iterSceneMetaNodes(const MetaRegistry& registry, const Scene& scene)
{
    std::vector<MetaNode::Ptr> result;
    for (const NodeHandle& node : scene.nodes()) {
        if (isMetaNode(registry, node)) {
            result.push_back(registry.construct(node, std::string{}, false));
        }
    }

    return result;
}

std::vector<MetaNode::Ptr>
findSceneRoots(const MetaRegistry& registry, const Scene& scene)
{
    std::vector<MetaNode::Ptr> result;
    for (const MetaNode::Ptr& metaNode : iterSceneMetaNodes(registry, scene)) {
        if (metaNode->isRoot()) {
            result.push_back(metaNode);
        }
    }

    return result;
}

std::vector<MetaNode::Ptr>
findMetaNodesByClassType(const MetaRegistry& registry,
                         const Scene& scene,
                         const std::string& classType)
{
    std::vector<MetaNode::Ptr> result;
    for (const MetaNode::Ptr& metaNode : iterSceneMetaNodes(registry, scene)) {
        if (metaNode->classType() == classType) {
            result.push_back(metaNode);
        }
    }

    return result;
}

std::vector<MetaNode::Ptr>
connectedMetaNodes(const MetaRegistry& registry,
                   const NodeHandle& node,
                   TraversalDirection direction)
{
    const bool downstream = (direction == TraversalDirection::DOWNSTREAM);

    std::vector<MetaNode::Ptr> result;
    for (const auto& connection : node_util::iterConnections(node, downstream, !downstream)) {
        const NodeHandle other = connection.second.node();
        if (isMetaNode(registry, other)) {
            result.push_back(registry.construct(other, std::string{}, false));
        }
    }

    return result;
}

bool
isConnectedToMeta(const MetaRegistry& registry, const NodeHandle& node)
{
    return upstreamMetaNode(registry, node).second != nullptr;
}

std::pair<Plug, MetaNode::Ptr>
upstreamMetaNode(const MetaRegistry& registry, const NodeHandle& node)
{
    for (const auto& connection : node_util::iterConnections(node, false, true)) {
        const NodeHandle source = connection.second.node();
        if (isMetaNode(registry, source)) {
            return { connection.first, registry.construct(source, std::string{}, false) };
        }
    }

    return { Plug(), nullptr };
}

std::vector<Plug>
filterSceneByAttributeValues(const MetaRegistry& registry,
                             const Scene& scene,
                             const StringVector& attrNames,
                             const std::string& pattern)
{
    std::regex regex;
    try {
        regex = std::regex(pattern);
    } catch (const std::regex_error& e) {
        MgLogError("Invalid filter '" << pattern << "': " << e.what());
        return {};
    }

    return filterScene(registry, scene, attrNames, [&regex](const Attribute& value) {
        const StringAttribute stringAttr(value);
        return stringAttr.isValid()
                && std::regex_search(stringAttr.getValue(std::string{}, false), regex);
    });
}

std::vector<Plug>
filterSceneByAttributeValues(const MetaRegistry& registry,
                             const Scene& scene,
                             const StringVector& attrNames,
                             const Attribute& value)
{
    return filterScene(registry, scene, attrNames, [&value](const Attribute& current) {
        return current.isValid() && value.isValid()
                && current.getHash().uint64() == value.getHash().uint64();
    });
}

} // namespace meta_util
} // namespace metagraph

