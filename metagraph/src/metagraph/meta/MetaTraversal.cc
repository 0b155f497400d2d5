// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#include "MetaTraversal.h"
#include "MetaNode.h"
#include "MetaRegistry.h"
#include "MetaUtil.h"

// metagraph
#include <metagraph/node/NodeUtil.h>

namespace metagraph {

MetaTraversal::Iterator::Iterator(const std::shared_ptr<const Params>& params)
    : mParams(params)
{
    if (mParams->depthLimit < 1) {
        return;
    }

    Frame root;
    root.landings = (mParams->mode == Mode::NAMED_ATTRIBUTE)
            ? landingsFrom(mParams->startPlug)
            : landingsFrom(mParams->startNode);
    root.depthLeft = mParams->depthLimit;
    mStack.push_back(std::move(root));

    advance();
}

MetaTraversal::Iterator&
MetaTraversal::Iterator::operator++()
{
    advance();
    return *this;
}

bool
MetaTraversal::Iterator::operator==(const Iterator& other) const
{
    return mCurrent == other.mCurrent;
}

void
MetaTraversal::Iterator::advance()
{
    mCurrent.reset();

    while (!mStack.empty()) {
        Frame& frame = mStack.back();
        if (frame.next >= frame.landings.size()) {
            mStack.pop_back();
            continue;
        }

        const Plug landing = frame.landings[frame.next++];
        const int depthLeft = frame.depthLeft;
        const NodeHandle node = landing.node();

        std::vector<Plug> nextLandings;
        if (mParams->mode == Mode::NAMED_ATTRIBUTE) {
            // the relation name has to carry over to the next node
            const Plug continued(node, mParams->attrName);
            if (!continued.isValid()) {
                continue;
            }
            if (depthLeft > 1) {
                nextLandings = landingsFrom(continued);
            }
        } else {
            if (!meta_util::isMetaNode(*mParams->registry, node)) {
                continue;
            }
            if (depthLeft > 1) {
                nextLandings = landingsFrom(node);
            }
        }

        mCurrent = mParams->registry->construct(node, std::string{}, false);

        if (depthLeft > 1) {
            Frame child;
            child.landings = std::move(nextLandings);
            child.depthLeft = depthLeft - 1;
            mStack.push_back(std::move(child));
        }
        return;
    }
}

std::vector<Plug>
MetaTraversal::Iterator::landingsFrom(const Plug& plug) const
{
    const bool downstream = (mParams->direction == TraversalDirection::DOWNSTREAM);

    std::vector<Plug> result;
    for (const auto& connection : plug.connectionsBelow(downstream, !downstream)) {
        result.push_back(connection.second);
    }

    return result;
}

std::vector<Plug>
MetaTraversal::Iterator::landingsFrom(const NodeHandle& node) const
{
    const bool downstream = (mParams->direction == TraversalDirection::DOWNSTREAM);

    std::vector<Plug> result;
    for (const auto& connection : node_util::iterConnections(node, downstream, !downstream)) {
        result.push_back(connection.second);
    }

    return result;
}

//-----------------------------------------

MetaTraversal::MetaTraversal(const Params& params)
    : mParams(std::make_shared<const Params>(params))
{
}

MetaTraversal
MetaTraversal::namedAttribute(const MetaRegistry& registry,
                              const Plug& startPlug,
                              TraversalDirection direction,
                              int depthLimit)
{
    Params params;
    params.registry = &registry;
    params.mode = Mode::NAMED_ATTRIBUTE;
    params.direction = direction;
    params.depthLimit = depthLimit;
    params.startPlug = startPlug;
    params.attrName = startPlug.attributeName();

    return MetaTraversal(params);
}

MetaTraversal
MetaTraversal::metaTree(const MetaRegistry& registry,
                        const NodeHandle& startNode,
                        TraversalDirection direction,
                        int depthLimit)
{
    Params params;
    params.registry = &registry;
    params.mode = Mode::META_TREE;
    params.direction = direction;
    params.depthLimit = depthLimit;
    params.startNode = startNode;

    return MetaTraversal(params);
}

MetaTraversal::Iterator
MetaTraversal::begin() const
{
    return Iterator(mParams);
}

std::vector<std::shared_ptr<MetaNode>>
MetaTraversal::toVector() const
{
    std::vector<std::shared_ptr<MetaNode>> result;
    for (const auto& metaNode : *this) {
        result.push_back(metaNode);
    }

    return result;
}

std::size_t
MetaTraversal::count() const
{
    std::size_t result = 0;
    for (auto it = begin(); it != end(); ++it) {
        ++result;
    }

    return result;
}

} // namespace metagraph

