// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

// metagraph
#include <metagraph/scene/Modifier.h>
#include <metagraph/scene/Plug.h>
#include <metagraph/scene/Scene.h>

// stl
#include <string>
#include <utility>
#include <vector>

namespace metagraph {
namespace node_util {

// As in plug_util, a null Modifier* means the call is applied right away.

/**
 * Creates a node of a registered node type. With a caller's Modifier the
 * handle becomes valid once that Modifier runs.
 */
NodeHandle createNode(Scene& scene,
                      const std::string& name,
                      const std::string& typeName,
                      const NodeHandle& parent = NodeHandle(),
                      Modifier* modifier = nullptr);

/**
 * Deletes the node and its DAG descendants. Locks on the nodes, on their
 * connected plugs and on the plugs they feed are cleared first, and every
 * connection is removed. Plugs of surviving nodes are locked again once
 * they are disconnected.
 */
void deleteNode(const NodeHandle& node, Modifier* modifier = nullptr);

void rename(const NodeHandle& node, const std::string& newName, Modifier* modifier = nullptr);

/**
 * Moves child under newParent (top level if unbound). With maintainOffset the
 * child's translate/rotate/scale are recomputed so its world placement does
 * not change.
 */
void reparent(const NodeHandle& child,
              const NodeHandle& newParent,
              bool maintainOffset,
              Modifier* modifier = nullptr);

/// See plug_util::connectPlugs().
void connect(const Plug& source,
             const Plug& destination,
             bool force = false,
             Modifier* modifier = nullptr);

/// See plug_util::disconnectPlug().
void disconnect(const Plug& plug,
                bool fromSource = true,
                bool fromDestination = true,
                Modifier* modifier = nullptr);

void setLocked(const NodeHandle& node, bool state, Modifier* modifier = nullptr);
void setLocked(const Plug& plug, bool state, Modifier* modifier = nullptr);

bool hasAttribute(const NodeHandle& node, const std::string& name);

/// Top level plugs of every attribute, static ones first.
std::vector<Plug> iterAttributes(const NodeHandle& node);

/// Top level plugs of the dynamic attributes.
std::vector<Plug> iterExtraAttributes(const NodeHandle& node);

/**
 * Connections of the node as (ours, theirs) plug pairs: outgoing ones when
 * source is set, incoming ones when destination is set.
 */
std::vector<std::pair<Plug, Plug>> iterConnections(const NodeHandle& node,
                                                   bool source = true,
                                                   bool destination = true);

/// Returns false if one of the names is not an attribute of the node.
bool setLockStateOnAttributes(const NodeHandle& node,
                              const StringVector& attrNames,
                              bool state,
                              Modifier* modifier = nullptr);

/// Sets the channel box flag of the named attributes.
bool showHideAttributes(const NodeHandle& node,
                        const StringVector& attrNames,
                        bool state,
                        Modifier* modifier = nullptr);

/**
 * Unlocks every locked plug taking part in a connection of the node, on
 * both ends, and removes those connections.
 */
void unlockAndDisconnectConnectedAttributes(const NodeHandle& node,
                                            Modifier* modifier = nullptr);

} // namespace node_util
} // namespace metagraph

