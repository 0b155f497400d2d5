// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

// metagraph
#include <metagraph/attribute/Attribute.h>
#include <metagraph/meta/MetaNode.h>
#include <metagraph/meta/MetaTraversal.h>
#include <metagraph/scene/Plug.h>
#include <metagraph/scene/Scene.h>

// stl
#include <string>
#include <utility>
#include <vector>

namespace metagraph {
namespace meta_util {

/// The node has an mClass attribute naming a type of the registry.
bool isMetaNode(const MetaRegistry& registry, const NodeHandle& node);

/// Every meta node of the scene in creation order.
std::vector<MetaNode::Ptr> iterSceneMetaNodes(const MetaRegistry& registry, const Scene& scene);

/// Meta nodes without meta parents.
std::vector<MetaNode::Ptr> findSceneRoots(const MetaRegistry& registry, const Scene& scene);

std::vector<MetaNode::Ptr> findMetaNodesByClassType(const MetaRegistry& registry,
                                                    const Scene& scene,
                                                    const std::string& classType);

/// Meta nodes directly connected to node, downstream or upstream of it.
std::vector<MetaNode::Ptr> connectedMetaNodes(const MetaRegistry& registry,
                                              const NodeHandle& node,
                                              TraversalDirection direction =
                                                      TraversalDirection::DOWNSTREAM);

/// The node is fed by a meta node.
bool isConnectedToMeta(const MetaRegistry& registry, const NodeHandle& node);

/**
 * First meta node feeding node, with the plug of node it feeds. A null
 * pointer and a null plug when there is none.
 */
std::pair<Plug, MetaNode::Ptr> upstreamMetaNode(const MetaRegistry& registry,
                                                const NodeHandle& node);

/**
 * Plugs of the given attributes on every meta node of the scene whose
 * string value matches the regular expression pattern. Missing attributes
 * and non-string values are skipped.
 */
std::vector<Plug> filterSceneByAttributeValues(const MetaRegistry& registry,
                                               const Scene& scene,
                                               const StringVector& attrNames,
                                               const std::string& pattern);

/// As above, keeping the plugs whose value equals value.
std::vector<Plug> filterSceneByAttributeValues(const MetaRegistry& registry,
                                               const Scene& scene,
                                               const StringVector& attrNames,
                                               const Attribute& value);

} // namespace meta_util
} // namespace metagraph

