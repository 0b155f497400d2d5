// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

// metagraph
#include <metagraph/scene/Plug.h>
#include <metagraph/scene/Scene.h>

// stl
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace metagraph {

/**
 * Batch of scene mutations applied as one undoable unit.
 *
 * Calls only queue commands; nothing changes until doIt(). Preconditions
 * (locks, existing connections, duplicate names) are checked when a command
 * runs, and if any command of a doIt() call throws, the commands already
 * applied by that call are undone before the exception propagates.
 *
 * createNode() returns the handle of the node right away; the handle becomes
 * valid when the command runs and may be used by later commands of the
 * same batch.
 *
 * Modifier m(scene);
 * NodeHandle node = m.createNode("network", "rigMeta");
 * m.addAttribute(node, makeAttributeSpec("version", AttributeKind::STRING));
 * m.doIt();
 * ...
 * m.undoIt();
 */
class Modifier
{
public:
    class Command
    {
    public:
        virtual ~Command() = default;

        virtual void doIt(Scene& scene) = 0;
        virtual void undoIt(Scene& scene) = 0;
        virtual std::string describe() const = 0;
    };

    explicit Modifier(Scene& scene);
    ~Modifier();

    Modifier(const Modifier&) = delete;
    Modifier& operator=(const Modifier&) = delete;

    Scene& scene() { return mScene; }

    /**
     * Creates a node of a registered node type. The name is made unique when
     * the command runs. parent must be a DAG node, and is only valid for DAG
     * types.
     */
    NodeHandle createNode(const std::string& typeName,
                          const std::string& name,
                          const NodeHandle& parent = NodeHandle());

    /// Deletes the node and its DAG descendants, disconnecting every edge.
    void deleteNode(const NodeHandle& node);

    void renameNode(const NodeHandle& node, const std::string& newName);

    /// Moves a DAG node under newParent, or to the top level if it is unbound.
    void reparentNode(const NodeHandle& child, const NodeHandle& newParent);

    /// Adds a dynamic attribute; returns the plug it will be reachable by.
    Plug addAttribute(const NodeHandle& node, const AttributeSpec::Ptr& spec);

    /// Removes a top level dynamic attribute with its values and edges.
    void removeAttribute(const Plug& plug);

    void renameAttribute(const Plug& plug, const std::string& newName);

    void connect(const Plug& source, const Plug& destination);
    void disconnect(const Plug& source, const Plug& destination);

    void setNodeLocked(const NodeHandle& node, bool locked);
    void setPlugLocked(const Plug& plug, bool locked);

    /// Stores a value on a leaf plug, converting it to the plug's kind.
    void setPlugValue(const Plug& plug, const Attribute& value);

    /// Removes one element of an array plug with its values and edges.
    void removeElement(const Plug& element);

    /**
     * Edits the definition of the plug's attribute (flags, default, bounds,
     * enum fields). The edit must not change the name or the kind.
     */
    void editAttribute(const Plug& plug, std::function<void(AttributeSpec&)> edit);

    /// Appends an arbitrary command.
    void addCommand(std::unique_ptr<Command> command);

    /// Runs every queued command that has not run yet.
    void doIt();

    /// Reverts every command that has run, newest first.
    void undoIt();

    std::size_t commandCount() const { return mCommands.size(); }
    bool isEmpty() const { return mCommands.empty(); }

private:
    Scene& mScene;
    std::vector<std::unique_ptr<Command>> mCommands;
    std::size_t mApplied = 0;
};

/**
 * The caller's Modifier, or a private one that commit() applies. Utility
 * functions take an optional Modifier* and use this so a call without a
 * batch is its own atomic unit.
 */
class ModifierScope
{
public:
    ModifierScope(Scene& scene, Modifier* modifier)
        : mOwned(modifier ? nullptr : new Modifier(scene))
        , mModifier(modifier ? modifier : mOwned.get())
    {}

    Modifier& operator*() const { return *mModifier; }
    Modifier* operator->() const { return mModifier; }

    void commit()
    {
        if (mOwned) {
            mOwned->doIt();
        }
    }

private:
    std::unique_ptr<Modifier> mOwned;
    Modifier* mModifier;
};

} // namespace metagraph

