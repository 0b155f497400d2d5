// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#include "Modifier.h"
#include "SceneInternal.h"

// metagraph
#include <metagraph/Errors.h>
#include <metagraph/logging/MetaGraphLogging.h>

// stl
#include <algorithm>
#include <map>

namespace {

MgLogSetup("Modifier");

using namespace metagraph;
using internal::ConnectionPtr;
using internal::NodeDataPtr;
using internal::PlugState;

using StateMap = std::map<std::string, PlugState>;

//-----------------------------------------
// storage helpers

void
linkConnection(const ConnectionPtr& connection)
{
    const auto source = connection->source.lock();
    const auto destination = connection->destination.lock();
    if (source) {
        source->connections.push_back(connection);
    }
    if (destination && destination != source) {
        destination->connections.push_back(connection);
    }
}

void
unlinkConnection(const ConnectionPtr& connection)
{
    const auto remove = [&](const NodeDataPtr& node) {
        if (node) {
            auto& connections = node->connections;
            connections.erase(std::remove(connections.begin(), connections.end(), connection),
                              connections.end());
        }
    };

    remove(connection->source.lock());
    remove(connection->destination.lock());
}

std::vector<ConnectionPtr>
connectionsAtOrBelow(const NodeDataPtr& node, const std::string& prefix)
{
    std::vector<ConnectionPtr> result;
    for (const auto& connection : node->connections) {
        const bool asSource = connection->source.lock() == node
                && internal::pathHasPrefix(connection->sourcePath, prefix);
        const bool asDestination = connection->destination.lock() == node
                && internal::pathHasPrefix(connection->destinationPath, prefix);
        if (asSource || asDestination) {
            result.push_back(connection);
        }
    }

    return result;
}

ConnectionPtr
findConnection(const NodeDataPtr& source, const std::string& sourcePath,
               const NodeDataPtr& destination, const std::string& destinationPath)
{
    for (const auto& connection : destination->connections) {
        if (connection->destination.lock() == destination
                && connection->destinationPath == destinationPath
                && connection->source.lock() == source
                && connection->sourcePath == sourcePath) {
            return connection;
        }
    }

    return nullptr;
}

Plug
destinationPlug(const internal::Connection& connection)
{
    const auto node = connection.destination.lock();
    return Plug::fromPath(NodeHandle(node ? node->scene : nullptr, node),
                          connection.destinationPath);
}

std::string
connectionName(const internal::Connection& connection)
{
    const auto source = connection.source.lock();
    const auto destination = connection.destination.lock();
    return (source ? source->name : std::string("?")) + "." + connection.sourcePath + " -> "
            + (destination ? destination->name : std::string("?")) + "." + connection.destinationPath;
}

void
checkDestinationsUnlocked(const std::vector<ConnectionPtr>& connections,
                          const std::string& operation)
{
    for (const auto& connection : connections) {
        const Plug destination = destinationPlug(*connection);
        if (destination.isValid() && destination.isLocked()) {
            throw LockedError::fromPlug(destination.name(), operation);
        }
    }
}

StateMap
statesAtOrBelow(const NodeDataPtr& node, const std::string& prefix)
{
    StateMap result;
    for (const auto& entry : node->plugs) {
        if (internal::pathHasPrefix(entry.first, prefix)) {
            result.insert(entry);
        }
    }

    return result;
}

void
eraseStates(const NodeDataPtr& node, const std::string& prefix)
{
    for (auto it = node->plugs.begin(); it != node->plugs.end(); ) {
        if (internal::pathHasPrefix(it->first, prefix)) {
            it = node->plugs.erase(it);
        } else {
            ++it;
        }
    }
}

void
checkNoLockedState(const NodeDataPtr& node, const StateMap& states,
                   const std::string& operation)
{
    for (const auto& entry : states) {
        if (entry.second.locked) {
            throw LockedError::fromPlug(node->name + "." + entry.first, operation);
        }
    }
}

void
checkNodeUnlocked(const NodeDataPtr& node, const std::string& operation)
{
    if (node->locked) {
        throw LockedError::fromNode(node->name, operation);
    }
}

void
checkAttributeName(const NodeDataPtr& node, const std::string& name)
{
    if (name.empty() || name.find_first_of(".[]| ") != std::string::npos) {
        throw MetaGraphError("Invalid attribute name '" + name + "' on node '"
                             + node->name + "'");
    }
}

/// Top level plug of a dynamic attribute, the only ones that can be edited.
AttributeSpec::Ptr
requireTopLevelDynamic(const Plug& plug, const std::string& operation)
{
    const AttributeSpec::Ptr spec = plug.spec();
    if (plug.isChild() || plug.isElement()) {
        throw MetaGraphError("Cannot " + operation + " '" + plug.name()
                             + "': not a top level attribute");
    }
    if (!spec->isDynamic) {
        throw MetaGraphError("Cannot " + operation + " '" + plug.name()
                             + "': static attributes are part of the node type");
    }

    return spec;
}

bool
kindsCompatible(AttributeKind a, AttributeKind b)
{
    if (isEdgeOnlyKind(a) || isEdgeOnlyKind(b)) {
        return isEdgeOnlyKind(a) && isEdgeOnlyKind(b);
    }
    if (isCompoundKind(a) || isCompoundKind(b)) {
        return isCompoundKind(a) && isCompoundKind(b);
    }
    if (isDataArrayKind(a) != isDataArrayKind(b)) {
        return false;
    }

    const bool aString = kindStorageType(a) == kAttrTypeString;
    const bool bString = kindStorageType(b) == kAttrTypeString;
    return aString == bString && kindTupleSize(a) == kindTupleSize(b);
}

//-----------------------------------------
// commands

class CreateNodeCommand : public Modifier::Command
{
public:
    CreateNodeCommand(const NodeDataPtr& node, const NodeHandle& parent)
        : mNode(node)
        , mRequestedName(node->name)
        , mParent(parent)
    {}

    void doIt(Scene& scene) override
    {
        if (mParent.isBound()) {
            const NodeDataPtr parent = mParent.data();
            if (!mNode->isDag || !parent->isDag) {
                throw MetaGraphError("Cannot parent '" + mRequestedName + "' under '"
                                     + parent->name + "': both nodes must be DAG nodes");
            }
            mNode->parent = parent;
        }

        mNode->name = scene.uniqueName(mRequestedName);
        internal::SceneAccess::attachNode(scene, mNode);
    }

    void undoIt(Scene& scene) override
    {
        internal::SceneAccess::detachNode(scene, mNode);
    }

    std::string describe() const override
    {
        return "createNode " + mRequestedName;
    }

private:
    NodeDataPtr mNode;
    std::string mRequestedName;
    NodeHandle mParent;
};

class DeleteNodeCommand : public Modifier::Command
{
public:
    explicit DeleteNodeCommand(const NodeHandle& node)
        : mHandle(node)
    {}

    void doIt(Scene& scene) override
    {
        mNode = mHandle.data();
        checkNodeUnlocked(mNode, "delete");

        // every edge must be removable before anything changes
        for (const auto& connection : mNode->connections) {
            const Plug destination = destinationPlug(*connection);
            if (destination.isValid() && destination.isLocked()) {
                throw LockedError::fromPlug(destination.name(), "delete " + mNode->name);
            }
        }

        mChildren.clear();
        try {
            for (const NodeHandle& child : mHandle.children()) {
                auto command = std::make_unique<DeleteNodeCommand>(child);
                command->doIt(scene);
                mChildren.push_back(std::move(command));
            }
        } catch (...) {
            undoChildren(scene);
            throw;
        }

        mConnections = mNode->connections;
        for (const auto& connection : mConnections) {
            unlinkConnection(connection);
        }

        internal::SceneAccess::detachNode(scene, mNode);
    }

    void undoIt(Scene& scene) override
    {
        internal::SceneAccess::attachNode(scene, mNode);
        for (const auto& connection : mConnections) {
            linkConnection(connection);
        }
        undoChildren(scene);
    }

    std::string describe() const override
    {
        return "deleteNode " + (mNode ? mNode->name : std::string());
    }

private:
    void undoChildren(Scene& scene)
    {
        for (auto it = mChildren.rbegin(); it != mChildren.rend(); ++it) {
            (*it)->undoIt(scene);
        }
        mChildren.clear();
    }

    NodeHandle mHandle;
    NodeDataPtr mNode;
    std::vector<ConnectionPtr> mConnections;
    std::vector<std::unique_ptr<DeleteNodeCommand>> mChildren;
};

class RenameNodeCommand : public Modifier::Command
{
public:
    RenameNodeCommand(const NodeHandle& node, const std::string& newName)
        : mHandle(node)
        , mNewName(newName)
    {}

    void doIt(Scene& scene) override
    {
        const NodeDataPtr node = mHandle.data();
        checkNodeUnlocked(node, "rename");
        if (mNewName.empty() || mNewName.find_first_of(".|[] ") != std::string::npos) {
            throw MetaGraphError("Invalid node name '" + mNewName + "'");
        }

        mOldName = node->name;
        if (mNewName != mOldName) {
            node->name = scene.uniqueName(mNewName);
        }
    }

    void undoIt(Scene&) override
    {
        mHandle.data()->name = mOldName;
    }

    std::string describe() const override
    {
        return "rename " + mOldName + " " + mNewName;
    }

private:
    NodeHandle mHandle;
    std::string mNewName;
    std::string mOldName;
};

class ReparentNodeCommand : public Modifier::Command
{
public:
    ReparentNodeCommand(const NodeHandle& child, const NodeHandle& newParent)
        : mChild(child)
        , mNewParent(newParent)
    {}

    void doIt(Scene&) override
    {
        const NodeDataPtr child = mChild.data();
        checkNodeUnlocked(child, "reparent");
        if (!child->isDag) {
            throw MetaGraphError("Cannot reparent '" + child->name + "': not a DAG node");
        }

        NodeDataPtr newParent;
        if (mNewParent.isBound()) {
            newParent = mNewParent.data();
            if (!newParent->isDag) {
                throw MetaGraphError("Cannot parent under '" + newParent->name
                                     + "': not a DAG node");
            }
            for (auto ancestor = newParent; ancestor; ancestor = ancestor->parent.lock()) {
                if (ancestor == child) {
                    throw MetaGraphError("Cannot parent '" + child->name + "' under its own descendant '"
                                         + newParent->name + "'");
                }
            }
        }

        mOldParent = child->parent.lock();
        moveUnder(child, mOldParent, newParent);
    }

    void undoIt(Scene&) override
    {
        const NodeDataPtr child = mChild.data();
        moveUnder(child, child->parent.lock(), mOldParent);
    }

    std::string describe() const override
    {
        return "reparent";
    }

private:
    static void moveUnder(const NodeDataPtr& child, const NodeDataPtr& from, const NodeDataPtr& to)
    {
        if (from) {
            auto& siblings = from->children;
            siblings.erase(std::remove_if(siblings.begin(), siblings.end(),
                                          [&](const std::weak_ptr<internal::NodeData>& sibling) {
                                              return sibling.lock() == child;
                                          }),
                           siblings.end());
        }

        child->parent = to;
        if (to) {
            to->children.push_back(child);
        }
    }

    NodeHandle mChild;
    NodeHandle mNewParent;
    NodeDataPtr mOldParent;
};

class AddAttributeCommand : public Modifier::Command
{
public:
    AddAttributeCommand(const NodeHandle& node, const AttributeSpec::Ptr& spec)
        : mHandle(node)
        , mSpec(spec->clone())
    {
        mSpec->isDynamic = true;
        for (auto& child : mSpec->children) {
            child->isDynamic = true;
        }
    }

    void doIt(Scene&) override
    {
        const NodeDataPtr node = mHandle.data();
        checkNodeUnlocked(node, "add attribute '" + mSpec->name + "'");
        checkAttributeName(node, mSpec->name);
        if (node->findAttribute(mSpec->name)) {
            throw AttributeAlreadyExistsError::fromName(node->name, mSpec->name);
        }
        for (const auto& child : mSpec->children) {
            checkAttributeName(node, child->name);
        }

        node->attributes.push_back(mSpec);
    }

    void undoIt(Scene&) override
    {
        const NodeDataPtr node = mHandle.data();
        auto& attributes = node->attributes;
        attributes.erase(std::remove(attributes.begin(), attributes.end(), mSpec),
                         attributes.end());
        eraseStates(node, mSpec->name);
    }

    std::string describe() const override
    {
        return "addAttribute " + mSpec->name;
    }

private:
    NodeHandle mHandle;
    AttributeSpec::Ptr mSpec;
};

class RemoveAttributeCommand : public Modifier::Command
{
public:
    explicit RemoveAttributeCommand(const Plug& plug)
        : mPlug(plug)
    {}

    void doIt(Scene&) override
    {
        const NodeDataPtr node = mPlug.node().data();
        const std::string operation = "remove attribute '" + mPlug.partialName() + "'";

        mSpec = requireTopLevelDynamic(mPlug, "remove");
        checkNodeUnlocked(node, operation);

        mStates = statesAtOrBelow(node, mSpec->name);
        checkNoLockedState(node, mStates, operation);

        mConnections = connectionsAtOrBelow(node, mSpec->name);
        checkDestinationsUnlocked(mConnections, operation);

        const auto it = std::find(node->attributes.begin(), node->attributes.end(), mSpec);
        mIndex = static_cast<std::size_t>(it - node->attributes.begin());

        for (const auto& connection : mConnections) {
            unlinkConnection(connection);
        }
        eraseStates(node, mSpec->name);
        node->attributes.erase(it);
    }

    void undoIt(Scene&) override
    {
        const NodeDataPtr node = mPlug.node().data();
        node->attributes.insert(node->attributes.begin() + mIndex, mSpec);
        node->plugs.insert(mStates.begin(), mStates.end());
        for (const auto& connection : mConnections) {
            linkConnection(connection);
        }
    }

    std::string describe() const override
    {
        return "removeAttribute " + mPlug.partialName();
    }

private:
    Plug mPlug;
    AttributeSpec::Ptr mSpec;
    std::size_t mIndex = 0;
    StateMap mStates;
    std::vector<ConnectionPtr> mConnections;
};

class RenameAttributeCommand : public Modifier::Command
{
public:
    RenameAttributeCommand(const Plug& plug, const std::string& newName)
        : mHandle(plug.node())
        , mOldName(plug.partialName())
        , mNewName(newName)
    {}

    void doIt(Scene&) override
    {
        const NodeDataPtr node = mHandle.data();
        const Plug plug(mHandle, mOldName);
        const std::string operation = "rename attribute '" + mOldName + "'";

        const AttributeSpec::Ptr spec = requireTopLevelDynamic(plug, "rename");
        checkNodeUnlocked(node, operation);
        checkNoLockedState(node, statesAtOrBelow(node, mOldName), operation);
        checkAttributeName(node, mNewName);
        if (node->findAttribute(mNewName)) {
            throw AttributeAlreadyExistsError::fromName(node->name, mNewName);
        }

        rename(node, spec, mOldName, mNewName);
    }

    void undoIt(Scene&) override
    {
        const NodeDataPtr node = mHandle.data();
        rename(node, node->findAttribute(mNewName), mNewName, mOldName);
    }

    std::string describe() const override
    {
        return "renameAttribute " + mOldName + " " + mNewName;
    }

private:
    static void rename(const NodeDataPtr& node, const AttributeSpec::Ptr& spec,
                       const std::string& from, const std::string& to)
    {
        spec->name = to;

        StateMap renamed;
        for (auto it = node->plugs.begin(); it != node->plugs.end(); ) {
            if (internal::pathHasPrefix(it->first, from)) {
                renamed.emplace(internal::replacePathPrefix(it->first, from, to), it->second);
                it = node->plugs.erase(it);
            } else {
                ++it;
            }
        }
        node->plugs.insert(renamed.begin(), renamed.end());

        for (const auto& connection : node->connections) {
            if (connection->source.lock() == node
                    && internal::pathHasPrefix(connection->sourcePath, from)) {
                connection->sourcePath = internal::replacePathPrefix(connection->sourcePath, from, to);
            }
            if (connection->destination.lock() == node
                    && internal::pathHasPrefix(connection->destinationPath, from)) {
                connection->destinationPath =
                        internal::replacePathPrefix(connection->destinationPath, from, to);
            }
        }
    }

    NodeHandle mHandle;
    std::string mOldName;
    std::string mNewName;
};

class ConnectCommand : public Modifier::Command
{
public:
    ConnectCommand(const Plug& source, const Plug& destination)
        : mSource(source)
        , mDestination(destination)
    {}

    void doIt(Scene&) override
    {
        const NodeDataPtr source = mSource.node().data();
        const NodeDataPtr destination = mDestination.node().data();
        const AttributeSpec::Ptr sourceSpec = mSource.spec();
        const AttributeSpec::Ptr destinationSpec = mDestination.spec();

        const std::string sourceName = mSource.name();
        const std::string destinationName = mDestination.name();

        if (source == destination) {
            throw ConnectionConflictError::fromPlugs(sourceName, destinationName,
                                                     "both plugs are on the same node");
        }
        if (mSource.isArray() || mDestination.isArray()) {
            throw ConnectionConflictError::fromPlugs(sourceName, destinationName,
                                                     "array plugs connect through their elements");
        }
        if (!kindsCompatible(sourceSpec->kind, destinationSpec->kind)) {
            throw ConnectionConflictError::fromPlugs(
                    sourceName, destinationName,
                    std::string("incompatible kinds ") + kindName(sourceSpec->kind)
                    + " and " + kindName(destinationSpec->kind));
        }
        if (mDestination.isLocked()) {
            throw LockedError::fromPlug(destinationName, "connect");
        }

        const Plug existing = mDestination.source();
        if (!existing.isNull()) {
            throw ConnectionConflictError::fromPlugs(
                    sourceName, destinationName,
                    "destination is already connected to '" + existing.name() + "'");
        }

        mConnection = std::make_shared<internal::Connection>();
        mConnection->source = source;
        mConnection->sourcePath = mSource.partialName();
        mConnection->destination = destination;
        mConnection->destinationPath = mDestination.partialName();
        linkConnection(mConnection);
    }

    void undoIt(Scene&) override
    {
        unlinkConnection(mConnection);
    }

    std::string describe() const override
    {
        return "connect " + mSource.partialName() + " " + mDestination.partialName();
    }

private:
    Plug mSource;
    Plug mDestination;
    ConnectionPtr mConnection;
};

class DisconnectCommand : public Modifier::Command
{
public:
    DisconnectCommand(const Plug& source, const Plug& destination)
        : mSource(source)
        , mDestination(destination)
    {}

    void doIt(Scene&) override
    {
        const NodeDataPtr source = mSource.node().data();
        const NodeDataPtr destination = mDestination.node().data();

        mConnection = findConnection(source, mSource.partialName(),
                                     destination, mDestination.partialName());
        if (!mConnection) {
            throw MetaGraphError("'" + mSource.name() + "' is not connected to '"
                                 + mDestination.name() + "'");
        }
        if (mDestination.isValid() && mDestination.isLocked()) {
            throw LockedError::fromPlug(mDestination.name(), "disconnect");
        }

        unlinkConnection(mConnection);
    }

    void undoIt(Scene&) override
    {
        linkConnection(mConnection);
    }

    std::string describe() const override
    {
        return "disconnect " + (mConnection ? connectionName(*mConnection) : std::string());
    }

private:
    Plug mSource;
    Plug mDestination;
    ConnectionPtr mConnection;
};

class SetNodeLockedCommand : public Modifier::Command
{
public:
    SetNodeLockedCommand(const NodeHandle& node, bool locked)
        : mHandle(node)
        , mLocked(locked)
    {}

    void doIt(Scene&) override
    {
        const NodeDataPtr node = mHandle.data();
        mWasLocked = node->locked;
        node->locked = mLocked;
    }

    void undoIt(Scene&) override
    {
        mHandle.data()->locked = mWasLocked;
    }

    std::string describe() const override
    {
        return mLocked ? "lockNode" : "unlockNode";
    }

private:
    NodeHandle mHandle;
    bool mLocked;
    bool mWasLocked = false;
};

/// Base for commands that change the stored state of a single plug.
class PlugStateCommand : public Modifier::Command
{
public:
    explicit PlugStateCommand(const Plug& plug)
        : mPlug(plug)
    {}

    void undoIt(Scene&) override
    {
        const NodeDataPtr node = mPlug.node().data();
        if (mHadState) {
            node->plugs[mPlug.partialName()] = mOldState;
        } else {
            node->plugs.erase(mPlug.partialName());
        }
    }

protected:
    PlugState& saveState()
    {
        const NodeDataPtr node = mPlug.node().data();
        const auto it = node->plugs.find(mPlug.partialName());
        mHadState = (it != node->plugs.end());
        if (mHadState) {
            mOldState = it->second;
        }

        return node->plugs[mPlug.partialName()];
    }

    Plug mPlug;
    bool mHadState = false;
    PlugState mOldState;
};

class SetPlugLockedCommand : public PlugStateCommand
{
public:
    SetPlugLockedCommand(const Plug& plug, bool locked)
        : PlugStateCommand(plug)
        , mLocked(locked)
    {}

    void doIt(Scene&) override
    {
        mPlug.spec();
        saveState().locked = mLocked;
    }

    std::string describe() const override
    {
        return (mLocked ? "lock " : "unlock ") + mPlug.partialName();
    }

private:
    bool mLocked;
};

class SetPlugValueCommand : public PlugStateCommand
{
public:
    SetPlugValueCommand(const Plug& plug, const Attribute& value)
        : PlugStateCommand(plug)
        , mValue(value)
    {}

    void doIt(Scene&) override
    {
        const AttributeSpec::Ptr spec = mPlug.spec();
        if (mPlug.isArray() || isCompoundKind(spec->kind) || isEdgeOnlyKind(spec->kind)) {
            throw UnsupportedKindOperationError::fromKind(
                    mPlug.name(), mPlug.isArray() ? "array" : kindName(spec->kind),
                    "storing a value directly");
        }
        if (mPlug.isLocked()) {
            throw LockedError::fromPlug(mPlug.name(), "set value");
        }
        if (mPlug.isDestination()) {
            throw ConnectionConflictError::fromPlugs(mPlug.source().name(), mPlug.name(),
                                                     "a connected destination cannot be set");
        }

        std::string error;
        const Attribute coerced = coerceToKind(spec->kind, mValue, &error);
        if (!coerced.isValid()) {
            throw InvalidValueError::fromPlug(mPlug.name(), kindName(spec->kind), error);
        }

        saveState().value = coerced;
    }

    std::string describe() const override
    {
        return "setAttr " + mPlug.partialName() + " " + toString(mValue);
    }

private:
    Attribute mValue;
};

class RemoveElementCommand : public Modifier::Command
{
public:
    explicit RemoveElementCommand(const Plug& element)
        : mElement(element)
    {}

    void doIt(Scene&) override
    {
        const NodeDataPtr node = mElement.node().data();
        if (!mElement.isElement()) {
            throw MetaGraphError("'" + mElement.name() + "' is not an array element");
        }
        mElement.spec();

        const std::string prefix = mElement.partialName();
        const std::string operation = "remove element '" + prefix + "'";
        if (mElement.parent().isLocked()) {
            throw LockedError::fromPlug(mElement.parent().name(), operation);
        }

        mStates = statesAtOrBelow(node, prefix);
        checkNoLockedState(node, mStates, operation);

        mConnections = connectionsAtOrBelow(node, prefix);
        checkDestinationsUnlocked(mConnections, operation);

        for (const auto& connection : mConnections) {
            unlinkConnection(connection);
        }
        eraseStates(node, prefix);
    }

    void undoIt(Scene&) override
    {
        const NodeDataPtr node = mElement.node().data();
        node->plugs.insert(mStates.begin(), mStates.end());
        for (const auto& connection : mConnections) {
            linkConnection(connection);
        }
    }

    std::string describe() const override
    {
        return "removeMultiInstance " + mElement.partialName();
    }

private:
    Plug mElement;
    StateMap mStates;
    std::vector<ConnectionPtr> mConnections;
};

class EditAttributeCommand : public Modifier::Command
{
public:
    EditAttributeCommand(const Plug& plug, std::function<void(AttributeSpec&)> edit)
        : mPlug(plug)
        , mEdit(std::move(edit))
    {}

    void doIt(Scene&) override
    {
        mSpec = mPlug.spec();
        mBefore = *mSpec;

        mEdit(*mSpec);
        if (mSpec->name != mBefore.name || mSpec->kind != mBefore.kind) {
            *mSpec = mBefore;
            throw MetaGraphError("Editing '" + mPlug.name() + "' may not change its name or kind");
        }
    }

    void undoIt(Scene&) override
    {
        *mSpec = mBefore;
    }

    std::string describe() const override
    {
        return "editAttribute " + mPlug.partialName();
    }

private:
    Plug mPlug;
    std::function<void(AttributeSpec&)> mEdit;
    AttributeSpec::Ptr mSpec;
    AttributeSpec mBefore;
};

} // anonymous namespace

namespace metagraph {

Modifier::Modifier(Scene& scene)
    : mScene(scene)
{
}

Modifier::~Modifier()
{
}

NodeHandle
Modifier::createNode(const std::string& typeName,
                     const std::string& name,
                     const NodeHandle& parent)
{
    const NodeType* nodeType = mScene.nodeTypes().find(typeName);
    if (!nodeType) {
        throw MetaGraphError("Unknown node type '" + typeName + "'");
    }
    if (name.empty() || name.find_first_of(".|[] ") != std::string::npos) {
        throw MetaGraphError("Invalid node name '" + name + "'");
    }

    const NodeDataPtr node = internal::SceneAccess::newNodeData(mScene, *nodeType, name);
    addCommand(std::make_unique<CreateNodeCommand>(node, parent));

    return NodeHandle(&mScene, node);
}

void
Modifier::deleteNode(const NodeHandle& node)
{
    addCommand(std::make_unique<DeleteNodeCommand>(node));
}

void
Modifier::renameNode(const NodeHandle& node, const std::string& newName)
{
    addCommand(std::make_unique<RenameNodeCommand>(node, newName));
}

void
Modifier::reparentNode(const NodeHandle& child, const NodeHandle& newParent)
{
    addCommand(std::make_unique<ReparentNodeCommand>(child, newParent));
}

Plug
Modifier::addAttribute(const NodeHandle& node, const AttributeSpec::Ptr& spec)
{
    addCommand(std::make_unique<AddAttributeCommand>(node, spec));
    return Plug(node, spec->name);
}

void
Modifier::removeAttribute(const Plug& plug)
{
    addCommand(std::make_unique<RemoveAttributeCommand>(plug));
}

void
Modifier::renameAttribute(const Plug& plug, const std::string& newName)
{
    addCommand(std::make_unique<RenameAttributeCommand>(plug, newName));
}

void
Modifier::connect(const Plug& source, const Plug& destination)
{
    addCommand(std::make_unique<ConnectCommand>(source, destination));
}

void
Modifier::disconnect(const Plug& source, const Plug& destination)
{
    addCommand(std::make_unique<DisconnectCommand>(source, destination));
}

void
Modifier::setNodeLocked(const NodeHandle& node, bool locked)
{
    addCommand(std::make_unique<SetNodeLockedCommand>(node, locked));
}

void
Modifier::setPlugLocked(const Plug& plug, bool locked)
{
    addCommand(std::make_unique<SetPlugLockedCommand>(plug, locked));
}

void
Modifier::setPlugValue(const Plug& plug, const Attribute& value)
{
    addCommand(std::make_unique<SetPlugValueCommand>(plug, value));
}

void
Modifier::removeElement(const Plug& element)
{
    addCommand(std::make_unique<RemoveElementCommand>(element));
}

void
Modifier::editAttribute(const Plug& plug, std::function<void(AttributeSpec&)> edit)
{
    addCommand(std::make_unique<EditAttributeCommand>(plug, std::move(edit)));
}

void
Modifier::addCommand(std::unique_ptr<Command> command)
{
    mCommands.push_back(std::move(command));
}

void
Modifier::doIt()
{
    const std::size_t first = mApplied;

    try {
        for (; mApplied < mCommands.size(); ++mApplied) {
            mCommands[mApplied]->doIt(mScene);
        }
    } catch (const std::exception& e) {
        MgLogDebug("'" << mCommands[mApplied]->describe() << "' failed, reverting "
                   << (mApplied - first) << " command(s): " << e.what());

        while (mApplied > first) {
            --mApplied;
            mCommands[mApplied]->undoIt(mScene);
        }

        // the failed batch is dropped so it can be queued again
        mCommands.resize(first);
        throw;
    }
}

void
Modifier::undoIt()
{
    while (mApplied > 0) {
        --mApplied;
        mCommands[mApplied]->undoIt(mScene);
    }
}

} // namespace metagraph

