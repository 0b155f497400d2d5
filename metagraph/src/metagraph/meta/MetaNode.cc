// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#include "MetaNode.h"
#include "MetaRegistry.h"

// metagraph
#include <metagraph/Errors.h>
#include <metagraph/attribute/AttributeUtils.h>
#include <metagraph/logging/MetaGraphLogging.h>
#include <metagraph/node/LockGuard.h>
#include <metagraph/node/NodeSerialization.h>
#include <metagraph/node/NodeUtil.h>
#include <metagraph/plug/PlugUtil.h>

// stl
#include <algorithm>
#include <deque>
#include <regex>
#include <set>

namespace {

MgLogSetup("MetaNode");

using namespace metagraph;

bool
isStandardAttribute(const std::string& name)
{
    return name == MetaNode::kClassAttr
            || name == MetaNode::kVersionAttr
            || name == MetaNode::kParentAttr
            || name == MetaNode::kChildrenAttr;
}

std::regex
compilePattern(const std::string& pattern)
{
    try {
        return std::regex(pattern);
    } catch (const std::regex_error& e) {
        throw MetaGraphError("Invalid pattern '" + pattern + "': " + e.what());
    }
}

void
appendUnique(std::vector<NodeHandle>& nodes, const NodeHandle& node)
{
    if (std::find(nodes.begin(), nodes.end(), node) == nodes.end()) {
        nodes.push_back(node);
    }
}

/**
 * Queues the removal of the attributes that only existed to hold edges
 * that are being disconnected, unlocking the nodes it has to on the way.
 */
class EdgeCleanup
{
public:
    explicit EdgeCleanup(Modifier& modifier)
        : mModifier(modifier)
    {}

    /**
     * plug loses its edges to departing, or only the one to detached when
     * given; drop it if nothing else holds it.
     */
    void release(const Plug& plug, const NodeHandle& departing, const Plug& detached = Plug())
    {
        if (!mReleased.insert(plug.name()).second) {
            return;
        }
        if (mDropped.count(plug.name()) != 0) {
            return;
        }

        const Plug owner = plug.isElement() ? plug.parent() : plug;
        const AttributeSpec::Ptr spec = owner.spec();
        if (!isEdgeOnlyKind(spec->kind)) {
            return;
        }

        for (const auto& connection : plug.connectionsBelow(true, true)) {
            const bool leaving = detached.isNull() ? connection.second.node() == departing
                                                   : connection.second == detached;
            if (!leaving) {
                return;
            }
        }

        if (plug.isElement()) {
            plug_util::unlockPlug(plug, &mModifier);
            mModifier.removeElement(plug);
            mDropped.insert(plug.name());
            return;
        }

        if (!spec->isDynamic || isStandardAttribute(spec->name) || !owner.parent().isNull()) {
            return;
        }

        unlockNode(plug.node());
        plug_util::unlockPlug(plug, &mModifier);
        mModifier.removeAttribute(plug);
        mDropped.insert(plug.name());
    }

    /**
     * Disconnects source from destination, clearing the locks that cover
     * destination. finish() puts them back unless the plug was dropped.
     */
    void disconnect(const Plug& source, const Plug& destination)
    {
        for (const Plug& cleared : plug_util::unlockPlug(destination, &mModifier)) {
            if (mRelocked.insert(cleared.name()).second) {
                mRelock.push_back(cleared);
            }
        }
        mModifier.disconnect(source, destination);
    }

    void unlockNode(const NodeHandle& node)
    {
        if (!node.isLocked()
                || std::find(mUnlocked.begin(), mUnlocked.end(), node) != mUnlocked.end()) {
            return;
        }

        mModifier.setNodeLocked(node, false);
        mUnlocked.push_back(node);
    }

    /// Queues the locks cleared by unlockNode() and disconnect() back on.
    void finish()
    {
        for (const Plug& plug : mRelock) {
            if (mDropped.count(plug.name()) == 0) {
                mModifier.setPlugLocked(plug, true);
            }
        }
        for (const NodeHandle& node : mUnlocked) {
            mModifier.setNodeLocked(node, true);
        }
    }

private:
    Modifier& mModifier;
    std::set<std::string> mReleased;
    std::set<std::string> mDropped;
    std::set<std::string> mRelocked;
    std::vector<Plug> mRelock;
    std::vector<NodeHandle> mUnlocked;
};

/// candidate is reachable from node along mMetaChildren edges.
bool
isMetaDescendant(const NodeHandle& node, const NodeHandle& candidate)
{
    std::set<uint64_t> visited { node.id() };
    std::deque<NodeHandle> pending { node };

    while (!pending.empty()) {
        const NodeHandle current = pending.front();
        pending.pop_front();

        const Plug childrenPlug(current, MetaNode::kChildrenAttr);
        if (!childrenPlug.isValid()) {
            continue;
        }

        for (const auto& connection : childrenPlug.connectionsBelow(true, false)) {
            const NodeHandle child = connection.second.node();
            if (child == candidate) {
                return true;
            }
            if (visited.insert(child.id()).second) {
                pending.push_back(child);
            }
        }
    }

    return false;
}

/// Queues the removal of the parent edges, from one parent if it is bound.
bool
queueRemoveParents(Modifier& modifier, const Plug& parentArray, const NodeHandle& parent)
{
    bool removed = false;
    for (const Plug& element : parentArray.elements()) {
        const Plug source = element.source();
        if (source.isNull() || (parent.isBound() && source.node() != parent)) {
            continue;
        }

        plug_util::unlockPlug(element, &modifier);
        modifier.disconnect(source, element);
        modifier.removeElement(element);
        removed = true;
    }

    return removed;
}

} // anonymous namespace

namespace metagraph {

MetaNode::MetaNode(const MetaRegistry& registry)
    : mRegistry(registry)
{
}

MetaNode::~MetaNode()
{
}

std::string
MetaNode::hostNodeType() const
{
    return NodeTypeRegistry::kNetwork;
}

std::vector<MetaAttribute>
MetaNode::metaAttributes() const
{
    std::vector<MetaAttribute> result;
    result.push_back({ makeAttributeSpec(kClassAttr, AttributeKind::STRING),
                       StringAttribute(typeName()), true });
    result.push_back({ makeAttributeSpec(kVersionAttr, AttributeKind::STRING),
                       StringAttribute(kVersion), true });
    result.push_back({ makeAttributeSpec(kParentAttr, AttributeKind::MESSAGE, true),
                       Attribute(), false });
    result.push_back({ makeAttributeSpec(kChildrenAttr, AttributeKind::MESSAGE),
                       Attribute(), false });

    return result;
}

MetaNode::State
MetaNode::state() const
{
    if (!mNode.isBound()) {
        return State::UNBOUND;
    }
    if (!mNode.isValid()) {
        return State::INVALID;
    }

    return Plug(mNode, kClassAttr).isValid() ? State::BOUND_INITIALIZED
                                             : State::BOUND_UNINITIALIZED;
}

bool
MetaNode::exists() const
{
    return mNode.isValid();
}

NodeHandle
MetaNode::node() const
{
    if (!mNode.isBound()) {
        throw MetaGraphError(std::string(kTypeName) + " is not bound to a node");
    }

    // throws once the node is gone
    mNode.data();
    return mNode;
}

void
MetaNode::bind(const NodeHandle& node)
{
    mNode = node;
}

void
MetaNode::initialize(bool lock)
{
    const NodeHandle current = node();

    {
        NodeLockGuard guard(current);
        Modifier modifier(*current.scene());
        queueInitialize(modifier, current, false);
        modifier.doIt();
    }

    if (lock) {
        node_util::setLocked(current, true);
    }
}

void
MetaNode::queueInitialize(Modifier& modifier, const NodeHandle& node, bool lock) const
{
    // a node created by the same batch has nothing yet
    const bool existing = node.isValid();

    for (const MetaAttribute& attr : metaAttributes()) {
        if (existing && node_util::hasAttribute(node, attr.spec->name)) {
            continue;
        }

        const Plug plug = modifier.addAttribute(node, attr.spec);
        if (attr.value.isValid()) {
            plug_util::setValue(plug, attr.value, &modifier);
        }
        if (attr.locked) {
            modifier.setPlugLocked(plug, true);
        }
    }

    if (lock) {
        modifier.setNodeLocked(node, true);
    }
}

NodeHandle
MetaNode::checkedNode() const
{
    const NodeHandle current = node();
    if (!Plug(current, kClassAttr).isValid()) {
        throw MetaGraphError("'" + current.name() + "' is not an initialized meta node");
    }

    return current;
}

//-----------------------------------------
// identity

std::string
MetaNode::classType() const
{
    return stringValue(requireAttribute(kClassAttr).value());
}

std::string
MetaNode::version() const
{
    return stringValue(requireAttribute(kVersionAttr).value());
}

std::string
MetaNode::name() const
{
    return checkedNode().name();
}

std::string
MetaNode::fullPathName() const
{
    return checkedNode().fullPathName();
}

void
MetaNode::rename(const std::string& newName)
{
    const NodeHandle current = checkedNode();
    withUnlockedNode(current, [&]() {
        node_util::rename(current, newName);
    });
}

bool
MetaNode::isLocked() const
{
    return checkedNode().isLocked();
}

void
MetaNode::lock(bool state)
{
    node_util::setLocked(checkedNode(), state);
}

bool
MetaNode::operator==(const MetaNode& other) const
{
    return mNode.isBound() && mNode == other.mNode;
}

//-----------------------------------------
// attributes

bool
MetaNode::hasAttribute(const std::string& name) const
{
    return Plug::fromPath(checkedNode(), name).isValid();
}

Plug
MetaNode::attribute(const std::string& name) const
{
    const Plug plug = Plug::fromPath(checkedNode(), name);
    return plug.isValid() ? plug : Plug();
}

Plug
MetaNode::requireAttribute(const std::string& name) const
{
    const Plug plug = attribute(name);
    if (plug.isNull()) {
        throw AttributeNotFoundError::fromName(mNode.name(), name);
    }

    return plug;
}

Attribute
MetaNode::getAttribute(const std::string& name) const
{
    const Plug plug = attribute(name);
    return plug.isNull() ? Attribute() : plug_util::getValue(plug);
}

Plug
MetaNode::addAttribute(const std::string& name,
                       const Attribute& value,
                       AttributeKind kind,
                       bool isArray,
                       bool lock)
{
    return addAttribute(makeAttributeSpec(name, kind, isArray), value, lock);
}

Plug
MetaNode::addAttribute(const AttributeSpec::Ptr& spec, const Attribute& value, bool lock)
{
    const NodeHandle current = checkedNode();
    if (hasAttribute(spec->name)) {
        throw AttributeAlreadyExistsError::fromName(current.name(), spec->name);
    }

    return withUnlockedNode(current, [&]() {
        Modifier modifier(*current.scene());
        const Plug plug = plug_util::addAttribute(current, spec, &modifier);
        if (value.isValid()) {
            plug_util::setValue(plug, value, &modifier);
        }
        if (lock) {
            modifier.setPlugLocked(plug, true);
        }
        modifier.doIt();

        return plug;
    });
}

void
MetaNode::setAttribute(const std::string& name, const Attribute& value)
{
    const Plug plug = requireAttribute(name);
    withUnlockedPlug(plug, [&]() {
        plug_util::setValue(plug, value);
    });
}

bool
MetaNode::removeAttribute(const std::string& name)
{
    const NodeHandle current = checkedNode();
    const Plug plug = attribute(name);
    if (plug.isNull()) {
        return false;
    }

    NodeLockGuard guard(current);
    Modifier modifier(*current.scene());
    EdgeCleanup cleanup(modifier);

    for (const Plug& below : plug_util::iterChildren(plug)) {
        if (below.isLocked()) {
            modifier.setPlugLocked(below, false);
        }
    }

    // peers drop the attributes that only held these edges
    for (const auto& outgoing : plug.connectionsBelow(true, false)) {
        cleanup.disconnect(outgoing.first, outgoing.second);
        cleanup.release(outgoing.second, current, outgoing.first);
    }
    for (const auto& incoming : plug.connectionsBelow(false, true)) {
        modifier.disconnect(incoming.second, incoming.first);
        cleanup.release(incoming.second, current, incoming.first);
    }

    modifier.removeAttribute(plug);
    cleanup.finish();
    modifier.doIt();

    return true;
}

void
MetaNode::renameAttribute(const std::string& name, const std::string& newName)
{
    const NodeHandle current = checkedNode();
    const Plug plug = requireAttribute(name);

    NodeLockGuard guard(current);
    Modifier modifier(*current.scene());

    // the lock moves with the attribute
    const bool locked = plug.isLocked();
    if (locked) {
        modifier.setPlugLocked(plug, false);
    }
    modifier.renameAttribute(plug, newName);
    if (locked) {
        modifier.setPlugLocked(Plug(current, newName), true);
    }

    modifier.doIt();
}

std::vector<Plug>
MetaNode::attributes() const
{
    return node_util::iterAttributes(checkedNode());
}

std::vector<Plug>
MetaNode::findPlugsByFilteredName(const std::string& pattern) const
{
    const std::regex regex = compilePattern(pattern);

    std::vector<Plug> result;
    for (const Plug& plug : attributes()) {
        if (std::regex_search(plug.partialName(), regex)) {
            result.push_back(plug);
        }
    }

    return result;
}

std::vector<Plug>
MetaNode::findPlugsByKind(AttributeKind kind) const
{
    std::vector<Plug> result;
    for (const Plug& plug : attributes()) {
        if (plug.kind() == kind) {
            result.push_back(plug);
        }
    }

    return result;
}

//-----------------------------------------
// connections

std::vector<std::pair<Plug, Plug>>
MetaNode::iterConnections(bool source, bool destination) const
{
    return node_util::iterConnections(checkedNode(), source, destination);
}

std::vector<NodeHandle>
MetaNode::findConnectedNodes(const std::string& attrName, const std::string& pattern) const
{
    const std::vector<Plug> plugs = attrName.empty()
            ? attributes()
            : std::vector<Plug> { requireAttribute(attrName) };

    const bool filtered = !pattern.empty();
    const std::regex regex = compilePattern(filtered ? pattern : ".*");

    std::vector<NodeHandle> result;
    for (const Plug& plug : plugs) {
        for (const auto& connection : plug.connectionsBelow(true, true)) {
            const NodeHandle other = connection.second.node();
            if (!filtered || std::regex_search(other.name(), regex)) {
                appendUnique(result, other);
            }
        }
    }

    return result;
}

std::vector<NodeHandle>
MetaNode::findConnectedNodesByAttributeName(const std::string& pattern, bool recursive) const
{
    std::vector<NodeHandle> result;

    const auto collect = [&result, &pattern](const MetaNode& metaNode) {
        for (const Plug& plug : metaNode.findPlugsByFilteredName(pattern)) {
            for (const auto& connection : plug.connectionsBelow(true, false)) {
                appendUnique(result, connection.second.node());
            }
        }
    };

    collect(*this);
    if (recursive) {
        for (const Ptr& child : children()) {
            if (child->state() == State::BOUND_INITIALIZED) {
                collect(*child);
            }
        }
    }

    return result;
}

Plug
MetaNode::connectTo(const std::string& attrName,
                    const NodeHandle& target,
                    const std::string& targetAttrName)
{
    const NodeHandle current = checkedNode();
    target.data();

    if (target == current) {
        throw ConnectionConflictError::fromPlugs(current.name() + "." + attrName,
                                                 target.name() + "." + targetAttrName,
                                                 "a meta node cannot connect to itself");
    }

    Plug source = attribute(attrName);
    Plug destination(target, targetAttrName);
    const bool destinationExists = destination.isValid();

    if (!source.isNull() && !isEdgeOnlyKind(source.kind())) {
        throw UnsupportedKindOperationError::fromKind(source.name(), kindName(source.kind()),
                                                      "connectTo");
    }
    if (destinationExists && !isEdgeOnlyKind(destination.kind())) {
        throw UnsupportedKindOperationError::fromKind(destination.name(),
                                                      kindName(destination.kind()),
                                                      "connectTo");
    }

    const bool connected = !source.isNull() && destinationExists
            && destination.source() == source;
    if (connected && source.destinations().size() == 1 && destination.isLocked()) {
        return destination;
    }

    NodeLockGuard guard(current);
    Modifier modifier(*current.scene());
    EdgeCleanup cleanup(modifier);

    // one target per relation name
    if (!source.isNull()) {
        for (const Plug& previous : source.destinations()) {
            if (previous == destination) {
                continue;
            }
            cleanup.disconnect(source, previous);
            cleanup.release(previous, current, source);
        }
    }

    if (destinationExists) {
        const Plug existing = destination.source();
        plug_util::unlockPlug(destination, &modifier);
        if (!existing.isNull() && existing != source) {
            modifier.disconnect(existing, destination);
            cleanup.release(existing, target, destination);
        }
    } else {
        cleanup.unlockNode(target);
        destination = modifier.addAttribute(
                target, makeAttributeSpec(targetAttrName, AttributeKind::MESSAGE));
    }

    if (source.isNull()) {
        source = modifier.addAttribute(current, makeAttributeSpec(attrName, AttributeKind::MESSAGE));
        modifier.setPlugLocked(source, true);
    }

    if (!connected) {
        modifier.connect(source, destination);
    }
    modifier.setPlugLocked(destination, true);

    cleanup.finish();
    modifier.doIt();

    MgLogDebug("'" << source.name() << "' -> '" << destination.name() << "'");
    return destination;
}

bool
MetaNode::disconnectFrom(const NodeHandle& target)
{
    const NodeHandle current = checkedNode();
    target.data();

    NodeLockGuard guard(current);
    Modifier modifier(*current.scene());
    EdgeCleanup cleanup(modifier);

    bool found = false;
    for (const auto& outgoing : node_util::iterConnections(current, true, false)) {
        if (outgoing.second.node() != target) {
            continue;
        }

        cleanup.disconnect(outgoing.first, outgoing.second);
        cleanup.release(outgoing.second, current);
        cleanup.release(outgoing.first, target);
        found = true;
    }

    cleanup.finish();
    modifier.doIt();

    return found;
}

//-----------------------------------------
// meta graph

void
MetaNode::addParent(const MetaNode& parent)
{
    const NodeHandle current = checkedNode();
    const NodeHandle parentNode = parent.checkedNode();

    const Plug parentArray = requireAttribute(kParentAttr);
    const Plug parentChildren = parent.requireAttribute(kChildrenAttr);

    if (parentNode == current) {
        throw ConnectionConflictError::fromPlugs(parentChildren.name(), parentArray.name(),
                                                 "a meta node cannot be its own parent");
    }

    for (const Plug& element : parentArray.elements()) {
        if (element.source() == parentChildren) {
            return;
        }
    }

    if (mRegistry.options().rejectCycles && isMetaDescendant(current, parentNode)) {
        throw ConnectionConflictError::fromPlugs(parentChildren.name(), parentArray.name(),
                                                 "the meta graph would contain a cycle");
    }

    PlugLockGuard guard(parentArray);
    Modifier modifier(*current.scene());

    Plug element;
    if (mRegistry.options().parentCardinality == ParentCardinality::SINGLE) {
        queueRemoveParents(modifier, parentArray, NodeHandle());
        element = parentArray.elementByLogicalIndex(0);
    } else {
        element = plug_util::nextAvailableElement(parentArray);
    }

    modifier.connect(parentChildren, element);
    modifier.doIt();
}

void
MetaNode::addChild(MetaNode& child)
{
    child.addParent(*this);
}

bool
MetaNode::removeParent(const MetaNode* parent)
{
    const NodeHandle current = checkedNode();
    const NodeHandle parentNode = parent ? parent->checkedNode() : NodeHandle();
    const Plug parentArray = requireAttribute(kParentAttr);

    PlugLockGuard guard(parentArray);
    Modifier modifier(*current.scene());
    const bool removed = queueRemoveParents(modifier, parentArray, parentNode);
    modifier.doIt();

    return removed;
}

bool
MetaNode::removeChild(MetaNode& child)
{
    return child.removeParent(this);
}

bool
MetaNode::removeChild(const NodeHandle& child)
{
    return mRegistry.construct(child, std::string{}, false)->removeParent(this);
}

std::vector<MetaNode::Ptr>
MetaNode::metaParents() const
{
    std::vector<Ptr> result;
    for (const Plug& element : requireAttribute(kParentAttr).elements()) {
        const Plug source = element.source();
        if (!source.isNull()) {
            result.push_back(mRegistry.construct(source.node(), std::string{}, false));
        }
    }

    return result;
}

std::vector<MetaNode::Ptr>
MetaNode::metaChildren() const
{
    std::vector<Ptr> result;
    for (const auto& connection : requireAttribute(kChildrenAttr).connectionsBelow(true, false)) {
        result.push_back(mRegistry.construct(connection.second.node(), std::string{}, false));
    }

    return result;
}

bool
MetaNode::isRoot() const
{
    return metaParents().empty();
}

MetaNode::Ptr
MetaNode::metaRoot() const
{
    std::set<uint64_t> visited { checkedNode().id() };

    Ptr root;
    std::vector<Ptr> parents = metaParents();
    while (!parents.empty()) {
        const Ptr next = parents.front();
        if (!visited.insert(next->node().id()).second) {
            break;
        }

        root = next;
        if (root->state() != State::BOUND_INITIALIZED) {
            break;
        }
        parents = root->metaParents();
    }

    return root;
}

MetaTraversal
MetaNode::children(int depthLimit) const
{
    return MetaTraversal::namedAttribute(mRegistry, requireAttribute(kChildrenAttr),
                                         TraversalDirection::DOWNSTREAM, depthLimit);
}

MetaTraversal
MetaNode::parents(int depthLimit) const
{
    return MetaTraversal::namedAttribute(mRegistry, requireAttribute(kParentAttr),
                                         TraversalDirection::UPSTREAM, depthLimit);
}

MetaTraversal
MetaNode::tree(int depthLimit, TraversalDirection direction) const
{
    return MetaTraversal::metaTree(mRegistry, checkedNode(), direction, depthLimit);
}

std::vector<MetaNode::Ptr>
MetaNode::findChildrenByClassType(const std::string& classType, int depthLimit) const
{
    std::vector<Ptr> result;
    for (const Ptr& child : children(depthLimit)) {
        if (child->state() == State::BOUND_INITIALIZED && child->classType() == classType) {
            result.push_back(child);
        }
    }

    return result;
}

std::vector<MetaNode::Ptr>
MetaNode::findChildrenByFilter(const std::string& pattern,
                               const std::string& attrName,
                               int depthLimit) const
{
    const std::regex regex = compilePattern(pattern);

    std::vector<Ptr> result;
    for (const Ptr& child : children(depthLimit)) {
        std::string text;
        if (attrName.empty()) {
            text = child->node().name();
        } else {
            const Plug plug = Plug::fromPath(child->node(), attrName);
            if (!plug.isValid()) {
                continue;
            }
            text = stringValue(plug.value());
        }

        if (std::regex_search(text, regex)) {
            result.push_back(child);
        }
    }

    return result;
}

//-----------------------------------------
// persistence

GroupAttribute
MetaNode::serialize() const
{
    return node_util::serializeNode(checkedNode());
}

void
MetaNode::deleteNode()
{
    const NodeHandle current = checkedNode();

    Modifier modifier(*current.scene());
    EdgeCleanup cleanup(modifier);

    for (const auto& outgoing : node_util::iterConnections(current, true, false)) {
        cleanup.disconnect(outgoing.first, outgoing.second);
        cleanup.release(outgoing.second, current);
    }
    for (const auto& incoming : node_util::iterConnections(current, false, true)) {
        plug_util::unlockPlug(incoming.first, &modifier);
        modifier.disconnect(incoming.second, incoming.first);
        cleanup.release(incoming.second, current);
    }

    cleanup.finish();
    modifier.doIt();

    try {
        node_util::deleteNode(current);
    } catch (const std::exception&) {
        modifier.undoIt();
        throw;
    }

    MgLogDebug("Deleted meta node #" << current.id());
}

} // namespace metagraph

