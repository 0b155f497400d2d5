// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

// metagraph
#include <metagraph/attribute/Attribute.h>
#include <metagraph/attribute/AttributeKind.h>
#include <metagraph/meta/MetaTraversal.h>
#include <metagraph/scene/Modifier.h>
#include <metagraph/scene/Plug.h>
#include <metagraph/scene/Scene.h>

// stl
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace metagraph {

class MetaRegistry;

/// An attribute a meta node type installs on its host node.
struct MetaAttribute
{
    AttributeSpec::Ptr spec;
    Attribute value;
    bool locked = true;
};

/**
 * Persistent metadata record bound to one host node.
 *
 * Everything a MetaNode knows lives on the host node: the mClass attribute
 * holds the type tag, mVersion the version, and the mMetaParent and
 * mMetaChildren message attributes carry the parent/child edges. Further
 * relations to arbitrary nodes are message connections created by
 * connectTo(). A MetaNode instance is only a view and can be rebuilt from
 * the node at any time with MetaRegistry::construct().
 *
 * Meta nodes are locked against direct edits. Every mutating method clears
 * the locks it needs for its own duration and restores them afterwards,
 * also when it throws.
 *
 * Subtypes declare kTypeName, override typeName(), extend metaAttributes()
 * and are registered with MetaRegistry::registerType<T>().
 */
class MetaNode
{
public:
    using Ptr = std::shared_ptr<MetaNode>;

    static constexpr const char* kTypeName = "MetaNode";

    static constexpr const char* kClassAttr = "mClass";
    static constexpr const char* kVersionAttr = "mVersion";
    static constexpr const char* kParentAttr = "mMetaParent";
    static constexpr const char* kChildrenAttr = "mMetaChildren";

    /// Attribute connectTo() creates on the target node by default.
    static constexpr const char* kTargetAttr = "metaNode";

    static constexpr const char* kVersion = "1.0.0";

    static constexpr int kDefaultDepthLimit = 256;

    enum class State
    {
        UNBOUND,                // no host node yet
        BOUND_UNINITIALIZED,    // host node without meta attributes
        BOUND_INITIALIZED,      // host node carries the meta attributes
        INVALID                 // host node deleted
    };

    explicit MetaNode(const MetaRegistry& registry);
    virtual ~MetaNode();

    MetaNode(const MetaNode&) = delete;
    MetaNode& operator=(const MetaNode&) = delete;

    /// The registered type tag of this class, written to mClass.
    virtual std::string typeName() const { return kTypeName; }

    /// Node type of host nodes created for this meta type.
    virtual std::string hostNodeType() const;

    /**
     * Attributes installed by initialize(). Subtypes append theirs to the
     * base class list.
     */
    virtual std::vector<MetaAttribute> metaAttributes() const;

    const MetaRegistry& registry() const { return mRegistry; }

    State state() const;

    /// Bound to a host node that still exists.
    bool exists() const;

    /// The host node; throws StaleReferenceError once it is deleted.
    NodeHandle node() const;

    /// Attaches the instance to a host node without touching the node.
    void bind(const NodeHandle& node);

    /**
     * Installs the meta attributes that are missing on the host node, and
     * locks the node when lock is set.
     */
    void initialize(bool lock = true);

    /**
     * Queues the creation of the meta attributes of this type on a node
     * that is itself created by modifier, see MetaRegistry::create().
     */
    void queueInitialize(Modifier& modifier, const NodeHandle& node, bool lock) const;

    //-----------------------------------------
    // identity

    /// Type tag stored on the node.
    std::string classType() const;
    std::string version() const;

    std::string name() const;
    std::string fullPathName() const;
    void rename(const std::string& newName);

    bool isLocked() const;
    void lock(bool state);

    bool operator==(const MetaNode& other) const;
    bool operator!=(const MetaNode& other) const { return !operator==(other); }

    //-----------------------------------------
    // attributes

    bool hasAttribute(const std::string& name) const;

    /// Plug of an attribute path, a null plug if there is none.
    Plug attribute(const std::string& name) const;

    /// Throws AttributeNotFoundError if there is no such attribute.
    Plug requireAttribute(const std::string& name) const;

    /// Value of an attribute, an invalid attribute if there is none.
    Attribute getAttribute(const std::string& name) const;

    /**
     * Adds a dynamic attribute holding value (if valid), locked when lock is
     * set. Throws AttributeAlreadyExistsError if the name is taken.
     */
    Plug addAttribute(const std::string& name,
                      const Attribute& value,
                      AttributeKind kind,
                      bool isArray = false,
                      bool lock = true);

    Plug addAttribute(const AttributeSpec::Ptr& spec,
                      const Attribute& value = Attribute(),
                      bool lock = true);

    /// Sets a value through the attribute's lock. Throws AttributeNotFoundError.
    void setAttribute(const std::string& name, const Attribute& value);

    /**
     * Disconnects and removes a dynamic attribute. Edge-only attributes that
     * only held its edges on the peers are removed too. False if there is none.
     */
    bool removeAttribute(const std::string& name);

    /// Throws AttributeNotFoundError.
    void renameAttribute(const std::string& name, const std::string& newName);

    /// Top level plugs, static attributes first.
    std::vector<Plug> attributes() const;

    /// Plugs whose name matches the regular expression anywhere.
    std::vector<Plug> findPlugsByFilteredName(const std::string& pattern) const;

    std::vector<Plug> findPlugsByKind(AttributeKind kind) const;

    //-----------------------------------------
    // connections

    /// (ours, theirs) plug pairs, see node_util::iterConnections().
    std::vector<std::pair<Plug, Plug>> iterConnections(bool source = true,
                                                       bool destination = true) const;

    /**
     * Nodes connected to attrName, or to any attribute when it is empty,
     * whose name matches pattern (everything when pattern is empty).
     * Throws AttributeNotFoundError if attrName is given but missing.
     */
    std::vector<NodeHandle> findConnectedNodes(const std::string& attrName = std::string{},
                                               const std::string& pattern = std::string{}) const;

    /**
     * Nodes fed by the attributes whose name matches pattern, including
     * those of every meta child when recursive is set.
     */
    std::vector<NodeHandle> findConnectedNodesByAttributeName(const std::string& pattern,
                                                              bool recursive = false) const;

    /**
     * Links this meta node to any node: the message attribute attrName is
     * connected to targetAttrName on target, each created when missing.
     *
     * The relation holds at most one target per name and the target plug
     * at most one source: edges already leaving attrName or entering the
     * target plug are removed first, together with the attributes that only
     * existed to hold them. Calling it again with the same target changes
     * nothing. The target plug is locked afterwards.
     *
     * Returns the target plug.
     */
    Plug connectTo(const std::string& attrName,
                   const NodeHandle& target,
                   const std::string& targetAttrName = kTargetAttr);

    /**
     * Removes every connection from this meta node to target and the
     * attributes that only existed to hold them. Returns false if there
     * was none.
     */
    bool disconnectFrom(const NodeHandle& target);

    //-----------------------------------------
    // meta graph

    /**
     * Connects parent's mMetaChildren to this node's mMetaParent. With
     * ParentCardinality::SINGLE an existing parent is removed first. Adding
     * the current parent again does nothing.
     *
     * Throws ConnectionConflictError if the edge would make a node its own
     * ancestor and the registry rejects cycles.
     */
    void addParent(const MetaNode& parent);
    void addChild(MetaNode& child);

    /// Removes the edge from parent, or from every parent when it is null.
    bool removeParent(const MetaNode* parent = nullptr);
    bool removeAllParents() { return removeParent(nullptr); }

    bool removeChild(MetaNode& child);
    bool removeChild(const NodeHandle& child);

    /// Direct meta parents in element order.
    std::vector<Ptr> metaParents() const;

    /// Direct meta children in connection order.
    std::vector<Ptr> metaChildren() const;

    bool isRoot() const;

    /// Top of the first-parent chain, nullptr if this node is a root.
    Ptr metaRoot() const;

    /// Descendants along mMetaChildren, see MetaTraversal.
    MetaTraversal children(int depthLimit = kDefaultDepthLimit) const;

    /// Ancestors along mMetaParent.
    MetaTraversal parents(int depthLimit = kDefaultDepthLimit) const;

    /**
     * Meta nodes reachable through any connection, see MetaTraversal. The
     * walk follows incoming connections unless told otherwise.
     */
    MetaTraversal tree(int depthLimit = kDefaultDepthLimit,
                       TraversalDirection direction = TraversalDirection::UPSTREAM) const;

    std::vector<Ptr> findChildrenByClassType(const std::string& classType,
                                             int depthLimit = kDefaultDepthLimit) const;

    /**
     * Descendants whose name, or the string value of attrName when given,
     * matches pattern.
     */
    std::vector<Ptr> findChildrenByFilter(const std::string& pattern,
                                          const std::string& attrName = std::string{},
                                          int depthLimit = kDefaultDepthLimit) const;

    //-----------------------------------------
    // persistence

    /// Node record of the host node, see node_util::serializeNode().
    GroupAttribute serialize() const;

    /**
     * Disconnects every edge of the host node, removes the attributes that
     * only existed on the other nodes to hold those edges, then deletes the
     * host node.
     */
    void deleteNode();

protected:
    /// Throws unless the instance is bound to an existing, initialized node.
    NodeHandle checkedNode() const;

private:
    const MetaRegistry& mRegistry;
    NodeHandle mNode;
};

} // namespace metagraph

