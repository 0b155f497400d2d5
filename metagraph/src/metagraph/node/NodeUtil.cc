// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#include "NodeUtil.h"

// metagraph
#include <metagraph/Errors.h>
#include <metagraph/logging/MetaGraphLogging.h>
#include <metagraph/plug/PlugUtil.h>
#include <metagraph/scene/TransformUtil.h>
#include <metagraph/scene/SceneInternal.h>

// stl
#include <algorithm>
#include <set>

namespace {

MgLogSetup("NodeUtil");

using namespace metagraph;

Scene&
sceneOf(const NodeHandle& node)
{
    node.data();
    return *node.scene();
}

void
collectSubtree(const NodeHandle& node, std::vector<NodeHandle>& nodes)
{
    nodes.push_back(node);
    for (const NodeHandle& child : node.children()) {
        collectSubtree(child, nodes);
    }
}

template <typename Visitor>
bool
forEachNamedPlug(const NodeHandle& node, const StringVector& attrNames, Visitor visit)
{
    bool found = true;
    for (const std::string& attrName : attrNames) {
        const Plug plug = Plug::fromPath(node, attrName);
        if (!plug.isValid()) {
            MgLogWarn("'" << node.name() << "' has no attribute '" << attrName << "'");
            found = false;
            continue;
        }
        visit(plug);
    }

    return found;
}

} // anonymous namespace

namespace metagraph {
namespace node_util {

NodeHandle
createNode(Scene& scene,
           const std::string& name,
           const std::string& typeName,
           const NodeHandle& parent,
           Modifier* modifier)
{
    ModifierScope scope(scene, modifier);
    const NodeHandle node = scope->createNode(typeName, name, parent);
    scope.commit();

    return node;
}

void
deleteNode(const NodeHandle& node, Modifier* modifier)
{
    ModifierScope scope(sceneOf(node), modifier);

    std::vector<NodeHandle> subtree;
    collectSubtree(node, subtree);

    // an edge between two nodes of the subtree is seen from both ends
    std::set<std::string> handled;
    std::vector<Plug> relock;
    for (const NodeHandle& current : subtree) {
        if (current.isLocked()) {
            scope->setNodeLocked(current, false);
        }

        std::vector<std::pair<Plug, Plug>> edges;
        for (const auto& outgoing : iterConnections(current, true, false)) {
            edges.emplace_back(outgoing.first, outgoing.second);
        }
        for (const auto& incoming : iterConnections(current, false, true)) {
            edges.emplace_back(incoming.second, incoming.first);
        }

        for (const auto& edge : edges) {
            if (!handled.insert(edge.first.name() + ">" + edge.second.name()).second) {
                continue;
            }

            const std::vector<Plug> cleared = plug_util::unlockPlug(edge.second, &*scope);
            scope->disconnect(edge.first, edge.second);

            const NodeHandle peer = edge.second.node();
            if (std::find(subtree.begin(), subtree.end(), peer) == subtree.end()) {
                relock.insert(relock.end(), cleared.begin(), cleared.end());
            }
        }
    }

    scope->deleteNode(node);

    // surviving peers get their locks back
    for (const Plug& plug : relock) {
        scope->setPlugLocked(plug, true);
    }
    scope.commit();
}

void
rename(const NodeHandle& node, const std::string& newName, Modifier* modifier)
{
    ModifierScope scope(sceneOf(node), modifier);
    scope->renameNode(node, newName);
    scope.commit();
}

void
reparent(const NodeHandle& child,
         const NodeHandle& newParent,
         bool maintainOffset,
         Modifier* modifier)
{
    if (child == newParent) {
        throw MetaGraphError("Cannot parent '" + child.name() + "' under itself");
    }

    ModifierScope scope(sceneOf(child), modifier);

    if (maintainOffset && transform::hasTransform(child)) {
        Imath::M44d offset = transform::worldMatrix(child);
        if (newParent.isBound()) {
            offset = offset * transform::worldMatrix(newParent).inverse();
        }

        scope->reparentNode(child, newParent);
        transform::setLocalMatrix(*scope, child, offset);
    } else {
        scope->reparentNode(child, newParent);
    }

    scope.commit();
}

void
connect(const Plug& source,
        const Plug& destination,
        bool force,
        Modifier* modifier)
{
    plug_util::connectPlugs(source, destination, force, modifier);
}

void
disconnect(const Plug& plug,
           bool fromSource,
           bool fromDestination,
           Modifier* modifier)
{
    plug_util::disconnectPlug(plug, fromSource, fromDestination, modifier);
}

void
setLocked(const NodeHandle& node, bool state, Modifier* modifier)
{
    ModifierScope scope(sceneOf(node), modifier);
    scope->setNodeLocked(node, state);
    scope.commit();
}

void
setLocked(const Plug& plug, bool state, Modifier* modifier)
{
    ModifierScope scope(sceneOf(plug.node()), modifier);
    scope->setPlugLocked(plug, state);
    scope.commit();
}

bool
hasAttribute(const NodeHandle& node, const std::string& name)
{
    return node.data()->findAttribute(name) != nullptr;
}

std::vector<Plug>
iterAttributes(const NodeHandle& node)
{
    std::vector<Plug> result;
    for (const auto& spec : node.data()->attributes) {
        if (!spec->isDynamic) {
            result.emplace_back(node, spec->name);
        }
    }

    const std::vector<Plug> extra = iterExtraAttributes(node);
    result.insert(result.end(), extra.begin(), extra.end());
    return result;
}

std::vector<Plug>
iterExtraAttributes(const NodeHandle& node)
{
    std::vector<Plug> result;
    for (const auto& spec : node.data()->attributes) {
        if (spec->isDynamic) {
            result.emplace_back(node, spec->name);
        }
    }

    return result;
}

std::vector<std::pair<Plug, Plug>>
iterConnections(const NodeHandle& node, bool source, bool destination)
{
    std::vector<std::pair<Plug, Plug>> result;
    for (const auto& connection : node.data()->connections) {
        const auto sourceData = connection->source.lock();
        const auto destinationData = connection->destination.lock();
        const Plug sourcePlug =
                Plug::fromPath(NodeHandle(node.scene(), sourceData), connection->sourcePath);
        const Plug destinationPlug =
                Plug::fromPath(NodeHandle(node.scene(), destinationData), connection->destinationPath);

        if (source && sourceData && sourceData->id == node.id()) {
            result.emplace_back(sourcePlug, destinationPlug);
        }
        if (destination && destinationData && destinationData->id == node.id()) {
            result.emplace_back(destinationPlug, sourcePlug);
        }
    }

    return result;
}

bool
setLockStateOnAttributes(const NodeHandle& node,
                         const StringVector& attrNames,
                         bool state,
                         Modifier* modifier)
{
    ModifierScope scope(sceneOf(node), modifier);
    const bool found = forEachNamedPlug(node, attrNames, [&](const Plug& plug) {
        if (plug.isLocked() != state) {
            scope->setPlugLocked(plug, state);
        }
    });
    scope.commit();

    return found;
}

bool
showHideAttributes(const NodeHandle& node,
                   const StringVector& attrNames,
                   bool state,
                   Modifier* modifier)
{
    ModifierScope scope(sceneOf(node), modifier);
    const bool found = forEachNamedPlug(node, attrNames, [&](const Plug& plug) {
        if (plug.isChannelBox() != state) {
            scope->editAttribute(plug, [state](AttributeSpec& spec) {
                spec.channelBox = state;
            });
        }
    });
    scope.commit();

    return found;
}

void
unlockAndDisconnectConnectedAttributes(const NodeHandle& node, Modifier* modifier)
{
    ModifierScope scope(sceneOf(node), modifier);

    for (const auto& outgoing : iterConnections(node, true, false)) {
        plug_util::unlockPlug(outgoing.first, &*scope);
        plug_util::unlockPlug(outgoing.second, &*scope);
        scope->disconnect(outgoing.first, outgoing.second);
    }

    for (const auto& incoming : iterConnections(node, false, true)) {
        plug_util::unlockPlug(incoming.first, &*scope);
        plug_util::unlockPlug(incoming.second, &*scope);
        scope->disconnect(incoming.second, incoming.first);
    }

    scope.commit();
}

} // namespace node_util
} // namespace metagraph

