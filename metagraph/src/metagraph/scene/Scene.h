// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

// metagraph
#include <metagraph/scene/NodeType.h>

// stl
#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace metagraph {

class Scene;

namespace internal {
struct NodeData;
struct SceneAccess;
} // namespace internal

/**
 * Non-owning reference to a node of a Scene.
 *
 * A handle stays safe to hold after its node is deleted: isValid() then
 * returns false and every accessor that needs the node throws
 * StaleReferenceError. A node deleted by a Modifier and restored by undoIt()
 * becomes valid again.
 */
class NodeHandle
{
public:
    NodeHandle() = default;
    NodeHandle(Scene* scene, const std::shared_ptr<internal::NodeData>& data);

    bool isValid() const;

    /// True if this handle was ever bound to a node, valid or not.
    bool isBound() const { return mId != 0; }

    Scene* scene() const { return mScene; }
    uint64_t id() const { return mId; }

    std::string name() const;
    std::string typeName() const;
    bool isDag() const;
    bool isLocked() const;

    /// DAG parent, or an unbound handle for DG and top level nodes.
    NodeHandle parent() const;
    std::vector<NodeHandle> children() const;

    /// "|grandparent|parent|node" for DAG nodes, the plain name otherwise.
    std::string fullPathName() const;

    /// The node, throws StaleReferenceError if it no longer exists.
    std::shared_ptr<internal::NodeData> data() const;

    bool operator==(const NodeHandle& other) const { return mId == other.mId; }
    bool operator!=(const NodeHandle& other) const { return mId != other.mId; }
    bool operator<(const NodeHandle& other) const { return mId < other.mId; }

private:
    Scene* mScene = nullptr;
    std::weak_ptr<internal::NodeData> mData;
    uint64_t mId = 0;
};

struct NodeHandleHash
{
    size_t operator()(const NodeHandle& handle) const
    {
        return std::hash<uint64_t>()(handle.id());
    }
};

/**
 * In-process scene graph: owns the nodes, their attribute slots and the
 * connections between slots. Reading is done through NodeHandle and Plug;
 * every mutation goes through a Modifier.
 *
 * A Scene is not thread safe for mutation. Concurrent reads are fine.
 */
class Scene
{
public:
    using ExtensionLoader = std::function<bool(NodeTypeRegistry&)>;

    Scene();
    ~Scene();

    Scene(const Scene&) = delete;
    Scene& operator=(const Scene&) = delete;

    NodeTypeRegistry& nodeTypes() { return mNodeTypes; }
    const NodeTypeRegistry& nodeTypes() const { return mNodeTypes; }

    /**
     * Makes an extension available to loadExtension(). The loader registers
     * the node types the extension provides and returns false on failure.
     */
    void registerExtension(const std::string& name, ExtensionLoader loader);

    /// Loads a registered extension once; returns false if it is unknown or fails.
    bool loadExtension(const std::string& name);
    bool isExtensionLoaded(const std::string& name) const;

    /// Node by name or DAG path, unbound handle if there is none.
    NodeHandle findNode(const std::string& name) const;

    /// Live nodes in creation order.
    std::vector<NodeHandle> nodes() const;
    std::size_t nodeCount() const { return mNodes.size(); }

    /// requested, or requested with the smallest numeric suffix that is free.
    std::string uniqueName(const std::string& requested) const;

private:
    friend struct internal::SceneAccess;

    std::shared_ptr<internal::NodeData> newNodeData(const NodeType& nodeType,
                                                    const std::string& name);

    void attachNode(const std::shared_ptr<internal::NodeData>& node);
    void detachNode(const std::shared_ptr<internal::NodeData>& node);

    NodeTypeRegistry mNodeTypes;
    std::vector<std::shared_ptr<internal::NodeData>> mNodes;
    uint64_t mNextId = 1;

    std::vector<std::pair<std::string, ExtensionLoader>> mExtensions;
    std::set<std::string> mLoadedExtensions;
};

} // namespace metagraph

