// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

// metagraph
#include <metagraph/scene/Plug.h>
#include <metagraph/scene/Scene.h>

// stl
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace metagraph {

class MetaNode;
class MetaRegistry;

enum class TraversalDirection
{
    DOWNSTREAM,     // source to destination
    UPSTREAM        // destination to source
};

/**
 * Lazy depth-bounded walk over connections, yielding the meta nodes it
 * reaches. Nothing is read until the sequence is iterated, and every call
 * to begin() starts the walk over.
 *
 * NAMED_ATTRIBUTE walks follow the connections of one attribute. Each hop
 * continues from the attribute of the same name on the node it reaches;
 * a node without that attribute ends the branch, not the walk. This is
 * what children() and parents() of a MetaNode use with mMetaChildren and
 * mMetaParent.
 *
 * META_TREE walks follow every connection of a node and yield the nodes
 * that are meta nodes, continuing from them.
 *
 * A depth limit of 1 yields the direct neighbours only; a limit below 1
 * yields nothing. The depth limit is the only bound: there is no visited
 * set, so a node reachable along two paths is yielded twice.
 *
 * The walk only reads the scene. Changing the graph while iterating is not
 * supported.
 */
class MetaTraversal
{
public:
    enum class Mode
    {
        NAMED_ATTRIBUTE,
        META_TREE
    };

    struct Params
    {
        const MetaRegistry* registry = nullptr;
        Mode mode = Mode::NAMED_ATTRIBUTE;
        TraversalDirection direction = TraversalDirection::DOWNSTREAM;
        int depthLimit = 0;

        // NAMED_ATTRIBUTE: the attribute every hop continues from
        Plug startPlug;
        std::string attrName;

        // META_TREE
        NodeHandle startNode;
    };

    class Iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::shared_ptr<MetaNode>;
        using difference_type = std::ptrdiff_t;
        using pointer = const value_type*;
        using reference = const value_type&;

        /// End iterator.
        Iterator() = default;

        reference operator*() const { return mCurrent; }
        pointer operator->() const { return &mCurrent; }

        Iterator& operator++();

        bool operator==(const Iterator& other) const;
        bool operator!=(const Iterator& other) const { return !operator==(other); }

    private:
        friend class MetaTraversal;

        explicit Iterator(const std::shared_ptr<const Params>& params);

        struct Frame
        {
            // plugs the connections of the previous node land on
            std::vector<Plug> landings;
            std::size_t next = 0;
            int depthLeft = 0;
        };

        void advance();
        std::vector<Plug> landingsFrom(const Plug& plug) const;
        std::vector<Plug> landingsFrom(const NodeHandle& node) const;

        std::shared_ptr<const Params> mParams;
        std::vector<Frame> mStack;
        std::shared_ptr<MetaNode> mCurrent;
    };

    /// Follows attrName starting from the connections of startPlug.
    static MetaTraversal namedAttribute(const MetaRegistry& registry,
                                        const Plug& startPlug,
                                        TraversalDirection direction,
                                        int depthLimit);

    /// Follows every connection starting from startNode.
    static MetaTraversal metaTree(const MetaRegistry& registry,
                                  const NodeHandle& startNode,
                                  TraversalDirection direction,
                                  int depthLimit);

    Iterator begin() const;
    Iterator end() const { return Iterator(); }

    /// Runs the whole walk.
    std::vector<std::shared_ptr<MetaNode>> toVector() const;
    std::size_t count() const;

    const Params& params() const { return *mParams; }

private:
    explicit MetaTraversal(const Params& params);

    std::shared_ptr<const Params> mParams;
};

} // namespace metagraph

