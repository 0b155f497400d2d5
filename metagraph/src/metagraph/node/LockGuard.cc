// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#include "LockGuard.h"

// metagraph
#include <metagraph/logging/MetaGraphLogging.h>
#include <metagraph/scene/Modifier.h>
#include <metagraph/scene/SceneInternal.h>

namespace {

MgLogSetup("LockGuard");

using namespace metagraph;

bool
hasOwnLock(const Plug& plug)
{
    const auto node = plug.node().data();
    const auto it = node->plugs.find(plug.partialName());
    return it != node->plugs.end() && it->second.locked;
}

} // anonymous namespace

namespace metagraph {

NodeLockGuard::NodeLockGuard(const NodeHandle& node)
    : mNode(node)
    , mWasLocked(node.isLocked())
{
    if (mWasLocked) {
        Modifier modifier(*mNode.scene());
        modifier.setNodeLocked(mNode, false);
        modifier.doIt();
    }
}

NodeLockGuard::~NodeLockGuard()
{
    if (!mWasLocked || !mNode.isValid()) {
        return;
    }

    try {
        Modifier modifier(*mNode.scene());
        modifier.setNodeLocked(mNode, true);
        modifier.doIt();
    } catch (const std::exception& e) {
        MgLogError("Failed to relock '" << mNode.name() << "': " << e.what());
    }
}

PlugLockGuard::PlugLockGuard(const Plug& plug)
{
    for (Plug current = plug; !current.isNull(); current = current.parent()) {
        if (hasOwnLock(current)) {
            mUnlocked.push_back(current);
        }
    }

    if (!mUnlocked.empty()) {
        Modifier modifier(*plug.node().scene());
        for (const Plug& locked : mUnlocked) {
            modifier.setPlugLocked(locked, false);
        }
        modifier.doIt();
    }
}

PlugLockGuard::~PlugLockGuard()
{
    if (mUnlocked.empty() || !mUnlocked.front().node().isValid()) {
        return;
    }

    Modifier modifier(*mUnlocked.front().node().scene());
    for (const Plug& locked : mUnlocked) {
        // the attribute may have been removed or renamed meanwhile
        if (locked.isValid()) {
            modifier.setPlugLocked(locked, true);
        }
    }

    try {
        modifier.doIt();
    } catch (const std::exception& e) {
        MgLogError("Failed to relock '" << mUnlocked.front().name() << "': " << e.what());
    }
}

} // namespace metagraph

