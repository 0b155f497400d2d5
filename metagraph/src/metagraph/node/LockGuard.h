// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

// metagraph
#include <metagraph/scene/Plug.h>
#include <metagraph/scene/Scene.h>

// stl
#include <utility>
#include <vector>

namespace metagraph {

/**
 * Clears the lock of a node for the lifetime of the guard and puts the
 * original state back when the guard goes out of scope, whether the guarded
 * code returns or throws. If the node is deleted meanwhile there is nothing
 * to restore.
 *
 * {
 *     NodeLockGuard guard(node);
 *     plug_util::createAttribute(node, "rigName", AttributeKind::STRING);
 * }
 */
class NodeLockGuard
{
public:
    explicit NodeLockGuard(const NodeHandle& node);
    ~NodeLockGuard();

    NodeLockGuard(const NodeLockGuard&) = delete;
    NodeLockGuard& operator=(const NodeLockGuard&) = delete;

    bool wasLocked() const { return mWasLocked; }

private:
    NodeHandle mNode;
    bool mWasLocked = false;
};

/**
 * Same as NodeLockGuard for a plug. Locks on the arrays and compounds above
 * the plug are cleared too, since they cover it.
 */
class PlugLockGuard
{
public:
    explicit PlugLockGuard(const Plug& plug);
    ~PlugLockGuard();

    PlugLockGuard(const PlugLockGuard&) = delete;
    PlugLockGuard& operator=(const PlugLockGuard&) = delete;

    bool wasLocked() const { return !mUnlocked.empty(); }

private:
    // plugs whose own lock was cleared, innermost first
    std::vector<Plug> mUnlocked;
};

/// Runs func with node unlocked; see NodeLockGuard.
template <typename Func>
auto
withUnlockedNode(const NodeHandle& node, Func&& func) -> decltype(func())
{
    NodeLockGuard guard(node);
    return std::forward<Func>(func)();
}

/// Runs func with plug unlocked; see PlugLockGuard.
template <typename Func>
auto
withUnlockedPlug(const Plug& plug, Func&& func) -> decltype(func())
{
    PlugLockGuard guard(plug);
    return std::forward<Func>(func)();
}

} // namespace metagraph

