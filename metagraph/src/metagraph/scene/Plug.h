// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

// metagraph
#include <metagraph/scene/AttributeSpec.h>
#include <metagraph/scene/Scene.h>

// stl
#include <string>
#include <vector>

namespace metagraph {

struct PlugPathElement
{
    std::string name;

    // logical index into an array attribute, -1 for the whole array
    int64_t index = -1;
};

using PlugPath = std::vector<PlugPathElement>;

/// Parses "arr[2].child"; returns false on malformed input.
bool parsePlugPath(const std::string& text, PlugPath& path);

std::string formatPlugPath(const PlugPath& path);

/**
 * Addresses one attribute slot on a node: a top level attribute, a child of
 * a compound, an element of an array, or any nesting of those. A Plug is a
 * value type; it does not keep the slot alive and is resolved against the
 * node every time it is read.
 */
class Plug
{
public:
    Plug() = default;
    Plug(const NodeHandle& node, PlugPath path);
    Plug(const NodeHandle& node, const std::string& attrName);

    /// Plug from "attr[2].child"; a null plug if the text is malformed.
    static Plug fromPath(const NodeHandle& node, const std::string& path);

    bool isNull() const { return !mNode.isBound() || mPath.empty(); }

    /// Node alive and the path resolves to an existing attribute.
    bool isValid() const;

    const NodeHandle& node() const { return mNode; }
    const PlugPath& path() const { return mPath; }

    /// "node.attr[2].child"
    std::string name() const;

    /// "attr[2].child"
    std::string partialName() const;

    /// Name of the attribute this plug addresses, without indices or parents.
    const std::string& attributeName() const;

    /**
     * Definition of the addressed attribute.
     * Throws StaleReferenceError or AttributeNotFoundError.
     */
    AttributeSpec::Ptr spec() const;

    AttributeKind kind() const { return spec()->kind; }

    /// Addresses a whole array attribute (not one of its elements).
    bool isArray() const;
    bool isElement() const { return !mPath.empty() && mPath.back().index >= 0; }
    bool isCompound() const { return spec()->kind == AttributeKind::COMPOUND; }
    bool isChild() const;
    bool isDynamic() const { return spec()->isDynamic; }
    int64_t logicalIndex() const { return mPath.empty() ? -1 : mPath.back().index; }

    /// Array plug of an element, compound plug of a child, else a null plug.
    Plug parent() const;

    Plug child(const std::string& childName) const;
    Plug child(std::size_t index) const;
    std::size_t numChildren() const;

    Plug elementByLogicalIndex(int64_t index) const;

    /// Sorted indices of the elements that hold a value or a connection.
    std::vector<int64_t> existingIndices() const;

    /// Elements of an array plug in index order.
    std::vector<Plug> elements() const;

    bool isLocked() const;
    bool isKeyable() const { return spec()->keyable; }
    bool isChannelBox() const { return spec()->channelBox; }

    /**
     * Stored value of a leaf plug, falling back to the attribute default.
     * Invalid for array, compound and message plugs.
     */
    Attribute value() const;

    /// True once a value was written to this leaf plug.
    bool hasStoredValue() const;

    bool isSource() const;
    bool isDestination() const;
    bool isConnected() const { return isSource() || isDestination(); }

    /// The plug feeding this one, null if there is none.
    Plug source() const;
    std::vector<Plug> destinations() const;

    /**
     * Every connected plug at or below this one as (ours, theirs) pairs,
     * e.g. the elements of an array plug.
     */
    std::vector<std::pair<Plug, Plug>> connectionsBelow(bool asSource,
                                                        bool asDestination) const;

    bool operator==(const Plug& other) const;
    bool operator!=(const Plug& other) const { return !operator==(other); }

private:
    NodeHandle mNode;
    PlugPath mPath;
};

} // namespace metagraph

