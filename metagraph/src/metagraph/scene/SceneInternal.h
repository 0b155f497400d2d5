// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

// metagraph
#include <metagraph/scene/AttributeSpec.h>
#include <metagraph/scene/Scene.h>

// stl
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace metagraph {

class Scene;

namespace internal {

struct NodeData;

struct PlugState
{
    Attribute value;
    bool locked = false;
};

/**
 * A directed edge between two plugs. Both endpoint nodes hold the same
 * object so renaming an attribute updates the edge for both sides.
 */
struct Connection
{
    std::weak_ptr<NodeData> source;
    std::string sourcePath;
    std::weak_ptr<NodeData> destination;
    std::string destinationPath;
};

using ConnectionPtr = std::shared_ptr<Connection>;

struct NodeData
{
    Scene* scene = nullptr;
    uint64_t id = 0;
    std::string name;
    std::string typeName;
    bool isDag = false;
    bool locked = false;

    // false until attached to the scene and again once deleted
    bool alive = false;

    std::weak_ptr<NodeData> parent;
    std::vector<std::weak_ptr<NodeData>> children;

    std::vector<AttributeSpec::Ptr> attributes;

    // keyed by plug path, e.g. "translate", "targets[2]", "comp.child"
    std::map<std::string, PlugState> plugs;

    std::vector<ConnectionPtr> connections;

    AttributeSpec::Ptr findAttribute(const std::string& attrName) const
    {
        for (const auto& spec : attributes) {
            if (spec->name == attrName) {
                return spec;
            }
        }
        return nullptr;
    }
};

using NodeDataPtr = std::shared_ptr<NodeData>;

/// Gives the Modifier commands access to node storage of the Scene.
struct SceneAccess
{
    static NodeDataPtr newNodeData(Scene& scene,
                                   const NodeType& nodeType,
                                   const std::string& name)
    {
        return scene.newNodeData(nodeType, name);
    }

    static void attachNode(Scene& scene, const NodeDataPtr& node)
    {
        scene.attachNode(node);
    }

    static void detachNode(Scene& scene, const NodeDataPtr& node)
    {
        scene.detachNode(node);
    }
};

/// True if path is prefix itself or a child or element plug below it.
inline bool
pathHasPrefix(const std::string& path, const std::string& prefix)
{
    if (path.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }

    return path.size() == prefix.size()
            || path[prefix.size()] == '.'
            || path[prefix.size()] == '[';
}

/// Replaces the leading prefix of a path, see pathHasPrefix().
inline std::string
replacePathPrefix(const std::string& path,
                  const std::string& prefix,
                  const std::string& replacement)
{
    return replacement + path.substr(prefix.size());
}

} // namespace internal
} // namespace metagraph

