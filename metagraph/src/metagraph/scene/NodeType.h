// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

// metagraph
#include <metagraph/scene/AttributeSpec.h>

// stl
#include <map>
#include <string>
#include <vector>

namespace metagraph {

/**
 * A node type declares the static attributes every node of the type starts
 * with. DAG types take part in the transform hierarchy.
 */
struct NodeType
{
    std::string name;
    bool isDag = false;
    std::vector<AttributeSpec::Ptr> attributes;

    // Extension that provides this type, empty for built-in types.
    std::string requirement;
};

class NodeTypeRegistry
{
public:
    /// Registry holding the built-in network, transform and joint types.
    NodeTypeRegistry();

    /**
     * Returns false if a type of the same name is already registered;
     * the existing definition is kept.
     */
    bool registerType(const NodeType& nodeType);

    const NodeType* find(const std::string& typeName) const;

    std::vector<std::string> typeNames() const;

    static constexpr const char* kNetwork = "network";
    static constexpr const char* kTransform = "transform";
    static constexpr const char* kJoint = "joint";

private:
    std::map<std::string, NodeType> mTypes;
};

} // namespace metagraph

