// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#include "NodeSerialization.h"
#include "NodeUtil.h"

// metagraph
#include <metagraph/Errors.h>
#include <metagraph/attribute/AttributeUtils.h>
#include <metagraph/logging/MetaGraphLogging.h>
#include <metagraph/plug/PlugSerialization.h>
#include <metagraph/plug/PlugUtil.h>

// pystring
#include <pystring/pystring.h>

// tbb
#include <tbb/parallel_for.h>

// stl
#include <map>

namespace {

MgLogSetup("NodeSerialization");

using namespace metagraph;

const std::string kName("name");
const std::string kType("type");
const std::string kLocked("locked");
const std::string kParent("parent");
const std::string kRequirements("requirements");
const std::string kAttributes("attributes");
const std::string kConnections("connections");

using NodeMap = std::map<std::string, NodeHandle>;

/// A node created from a record whose connections and locks are still due.
struct PendingNode
{
    NodeHandle mNode;
    GroupAttribute mRecord;
    std::vector<Plug> mLockedPlugs;
    bool mLocked = false;
};

std::string
leafName(const std::string& pathOrName)
{
    std::vector<std::string> parts;
    pystring::split(pathOrName, parts, "|");
    while (!parts.empty() && parts.back().empty()) {
        parts.pop_back();
    }

    return parts.empty() ? std::string() : parts.back();
}

/// Nodes created by the current batch first, then the scene.
NodeHandle
resolveNode(const Scene& scene, const NodeMap& created, const std::string& pathOrName)
{
    const auto it = created.find(leafName(pathOrName));
    if (it != created.end() && it->second.isValid()) {
        return it->second;
    }

    return scene.findNode(pathOrName);
}

PendingNode
createFromRecord(Scene& scene, const GroupAttribute& record, const NodeMap& created)
{
    const std::string name = leafName(stringValue(record.getChildByName(kName)));
    const std::string typeName = stringValue(record.getChildByName(kType));
    const std::string parentPath = stringValue(record.getChildByName(kParent));

    for (const std::string& requirement : stringValues(record.getChildByName(kRequirements))) {
        if (!scene.loadExtension(requirement)) {
            throw MissingRequirementError::fromRequirement(name, requirement);
        }
    }

    NodeHandle parent;
    if (!parentPath.empty()) {
        parent = resolveNode(scene, created, parentPath);
        if (!parent.isBound()) {
            throw NodeNotFoundError::fromName(parentPath);
        }
    }

    PendingNode pending;
    pending.mRecord = record;
    pending.mLocked = boolValue(record.getChildByName(kLocked));

    Modifier creation(scene);
    pending.mNode = creation.createNode(typeName, name, parent);
    creation.doIt();

    try {
        // locks go on last, after values and connections are in
        Modifier attributes(scene);
        const GroupAttribute attrRecords = record.getChildByName(kAttributes);
        for (const auto child : attrRecords) {
            const GroupAttribute attrRecord = child.attribute;
            const bool locked = boolValue(attrRecord.getChildByName(kLocked));

            GroupBuilder gb;
            gb.update(attrRecord);
            gb.set(kLocked, IntAttribute(0));

            const Plug plug = plug_util::deserializePlug(pending.mNode, gb.build(), &attributes);
            if (locked) {
                pending.mLockedPlugs.push_back(plug);
            }
        }
        attributes.doIt();
    } catch (const std::exception&) {
        creation.undoIt();
        throw;
    }

    return pending;
}

void
connectFromRecord(const Scene& scene, const PendingNode& pending, const NodeMap& created)
{
    const StringAttribute connections = pending.mRecord.getChildByName(kConnections);
    if (!connections.isValid()) {
        return;
    }

    const auto values = connections.getNearestSample(0.f);
    for (std::size_t i = 0; i + 2 < values.size(); i += 3) {
        const std::string destinationPath(values[i]);
        const std::string sourceNodeName(values[i + 1]);
        const std::string sourcePath(values[i + 2]);

        const NodeHandle sourceNode = resolveNode(scene, created, sourceNodeName);
        if (!sourceNode.isBound()) {
            MgLogWarn("'" << pending.mNode.name() << "." << destinationPath
                      << "': source node '" << sourceNodeName << "' does not exist");
            continue;
        }

        const Plug source = Plug::fromPath(sourceNode, sourcePath);
        const Plug destination = Plug::fromPath(pending.mNode, destinationPath);
        if (!source.isValid() || !destination.isValid()) {
            MgLogWarn("Skipping connection '" << sourceNodeName << "." << sourcePath << "' -> '"
                      << pending.mNode.name() << "." << destinationPath << "'");
            continue;
        }

        try {
            plug_util::connectPlugs(source, destination, true);
        } catch (const MetaGraphError& e) {
            MgLogWarn(e.what());
        }
    }
}

void
lockFromRecord(Scene& scene, const PendingNode& pending)
{
    Modifier locks(scene);
    for (const Plug& plug : pending.mLockedPlugs) {
        locks.setPlugLocked(plug, true);
    }
    if (pending.mLocked) {
        locks.setNodeLocked(pending.mNode, true);
    }

    try {
        locks.doIt();
    } catch (const MetaGraphError& e) {
        MgLogWarn("Failed to restore locks of '" << pending.mNode.name() << "': " << e.what());
    }
}

} // anonymous namespace

namespace metagraph {
namespace node_util {

GroupAttribute
serializeNode(const NodeHandle& node, bool includeConnections)
{
    GroupBuilder gb;
    gb.set(kName, StringAttribute(node.name()));
    gb.set(kType, StringAttribute(node.typeName()));
    gb.set(kLocked, IntAttribute(node.isLocked() ? 1 : 0));

    const NodeHandle parent = node.parent();
    if (parent.isBound()) {
        gb.set(kParent, StringAttribute(parent.fullPathName()));
    }

    const NodeType* nodeType = node.scene()->nodeTypes().find(node.typeName());
    if (nodeType && !nodeType->requirement.empty()) {
        gb.set(kRequirements, StringAttribute(nodeType->requirement));
    }

    GroupBuilder attributesGb;
    int64_t attrIndex = 0;
    for (const Plug& plug : iterAttributes(node)) {
        const GroupAttribute attrRecord = plug_util::serializePlug(plug);
        if (attrRecord.isValid()) {
            attributesGb.set(std::to_string(attrIndex++), attrRecord);
        }
    }
    gb.set(kAttributes, attributesGb.build());

    if (includeConnections) {
        StringVector connections;
        for (const auto& connection : iterConnections(node, false, true)) {
            connections.push_back(connection.first.partialName());
            connections.push_back(connection.second.node().name());
            connections.push_back(connection.second.partialName());
        }
        if (!connections.empty()) {
            gb.set(kConnections, StringAttribute(connections, 3));
        }
    }

    return gb.build();
}

GroupAttribute
serializeNodes(const std::vector<NodeHandle>& nodes, bool includeConnections)
{
    std::vector<GroupAttribute> records(nodes.size());

    tbb::parallel_for(int64_t(0), static_cast<int64_t>(nodes.size()), int64_t(1),
        [&](int64_t i)
        {
            records[i] = serializeNode(nodes[i], includeConnections);
        });

    GroupBuilder gb;
    for (std::size_t i = 0; i < records.size(); ++i) {
        gb.set(std::to_string(i), records[i]);
    }

    return gb.build();
}

NodeHandle
deserializeNode(Scene& scene, const GroupAttribute& record)
{
    const NodeMap created;
    const PendingNode pending = createFromRecord(scene, record, created);
    connectFromRecord(scene, pending, created);
    lockFromRecord(scene, pending);

    return pending.mNode;
}

std::vector<NodeHandle>
deserializeNodes(Scene& scene, const GroupAttribute& records)
{
    MetaGraphLogging::ThreadLogPool logPool(true, "deserializeNodes");

    std::vector<GroupAttribute> recordList;
    for (const auto child : records) {
        recordList.push_back(child.attribute);
    }

    std::vector<PendingNode> pending(recordList.size());
    std::vector<bool> done(recordList.size(), false);
    NodeMap created;

    const auto recordName = [&](std::size_t i) {
        return leafName(stringValue(recordList[i].getChildByName(kName)));
    };

    // parents before children, whatever the record order
    const auto waitsForParent = [&](std::size_t i) {
        const std::string parentPath = stringValue(recordList[i].getChildByName(kParent));
        if (parentPath.empty() || resolveNode(scene, created, parentPath).isBound()) {
            return false;
        }
        const std::string parentName = leafName(parentPath);
        for (std::size_t j = 0; j < recordList.size(); ++j) {
            if (!done[j] && j != i && recordName(j) == parentName) {
                return true;
            }
        }
        return false;
    };

    for (bool progress = true; progress; ) {
        progress = false;
        for (std::size_t i = 0; i < recordList.size(); ++i) {
            if (done[i] || waitsForParent(i)) {
                continue;
            }

            done[i] = true;
            progress = true;
            try {
                pending[i] = createFromRecord(scene, recordList[i], created);
                created[recordName(i)] = pending[i].mNode;
            } catch (const std::exception& e) {
                MgLogError("Skipping node record '" << recordName(i) << "': " << e.what());
            }
        }
    }

    for (std::size_t i = 0; i < recordList.size(); ++i) {
        if (!done[i]) {
            MgLogError("Skipping node record '" << recordName(i) << "': parent was never created");
        }
    }

    std::vector<NodeHandle> result;
    for (const PendingNode& node : pending) {
        if (node.mNode.isValid()) {
            connectFromRecord(scene, node, created);
        }
    }
    for (const PendingNode& node : pending) {
        if (node.mNode.isValid()) {
            lockFromRecord(scene, node);
        }
        result.push_back(node.mNode);
    }

    return result;
}

} // namespace node_util
} // namespace metagraph

