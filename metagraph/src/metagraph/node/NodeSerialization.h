// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

// metagraph
#include <metagraph/attribute/Attribute.h>
#include <metagraph/scene/Scene.h>

// stl
#include <vector>

namespace metagraph {
namespace node_util {

/**
 * Node record:
 * {
 *   name          StringAttribute
 *   type          StringAttribute
 *   locked        IntAttribute
 *   parent        StringAttribute, DAG path of the parent (DAG nodes only)
 *   requirements  StringAttribute, extensions the node type needs (optional)
 *   attributes    GroupAttribute of attribute records keyed "0", "1", ...
 *   connections   StringAttribute with tuple size 3 holding
 *                 (destinationAttrPath, sourceNodeName, sourceAttrPath)
 *                 for every incoming connection
 * }
 * Static attributes at their default value are left out.
 */
GroupAttribute serializeNode(const NodeHandle& node, bool includeConnections = true);

/// Node records keyed "0", "1", ... in the order of nodes. Runs in parallel.
GroupAttribute serializeNodes(const std::vector<NodeHandle>& nodes,
                              bool includeConnections = true);

/**
 * Creates the node of a record with its attributes, values, connections and
 * locks. Sources of connections are looked up by name in the scene; missing
 * ones are skipped with a warning. The node may get a different name if the
 * recorded one is taken.
 *
 * Throws MissingRequirementError if a required extension cannot be loaded,
 * NodeNotFoundError if the parent does not exist. Nothing is created when it
 * throws.
 */
NodeHandle deserializeNode(Scene& scene, const GroupAttribute& record);

/**
 * Deserializes every record of serializeNodes(). All nodes are created
 * before any connection is made, so records may refer to each other in any
 * order. A record that fails is logged and skipped; the others are still
 * created. Returns the created nodes in record order, an unbound handle for
 * each skipped record.
 */
std::vector<NodeHandle> deserializeNodes(Scene& scene, const GroupAttribute& records);

} // namespace node_util
} // namespace metagraph

