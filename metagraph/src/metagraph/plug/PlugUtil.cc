// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#include "PlugUtil.h"

// metagraph
#include <metagraph/Errors.h>
#include <metagraph/logging/MetaGraphLogging.h>

// pystring
#include <pystring/pystring.h>

// stl
#include <algorithm>
#include <cctype>

namespace {

MgLogSetup("PlugUtil");

using namespace metagraph;

Scene&
sceneOf(const NodeHandle& node)
{
    // throws if the node is gone
    node.data();
    return *node.scene();
}

bool
sameValue(const Attribute& a, const Attribute& b)
{
    if (!a.isValid() || !b.isValid()) {
        return a.isValid() == b.isValid();
    }

    return a.getHash().uint64() == b.getHash().uint64();
}

bool
holdsValue(const Plug& plug)
{
    const AttributeSpec::Ptr spec = plug.spec();
    return !plug.isArray()
            && !isCompoundKind(spec->kind)
            && !isEdgeOnlyKind(spec->kind);
}

Attribute
leafDefault(const AttributeSpec& spec)
{
    if (spec.defaultValue.isValid()) {
        return spec.defaultValue;
    }

    return kindDefaultValue(spec.kind);
}

/// Plug a message value refers to, "node.attr[1]".
Plug
resolvePlugReference(Scene& scene, const std::string& reference)
{
    const int dot = pystring::find(reference, ".");
    if (dot <= 0) {
        return {};
    }

    const NodeHandle node = scene.findNode(pystring::slice(reference, 0, dot));
    if (!node.isBound()) {
        throw NodeNotFoundError::fromName(pystring::slice(reference, 0, dot));
    }

    return Plug::fromPath(node, pystring::slice(reference, dot + 1));
}

void
queueValue(Modifier& modifier, const Plug& plug, const Attribute& value)
{
    const AttributeSpec::Ptr spec = plug.spec();

    if (plug.isArray()) {
        const GroupAttribute group(value);
        if (!group.isValid()) {
            throw InvalidValueError::fromPlug(plug.name(), kindName(spec->kind),
                                              "arrays are set from a group keyed by element");
        }

        for (const auto child : group) {
            int64_t index = -1;
            if (!plug_util::parseElementKey(child.name, index)) {
                throw InvalidValueError::fromPlug(plug.name(), kindName(spec->kind),
                                                  "bad element key '" + child.name + "'");
            }
            queueValue(modifier, plug.elementByLogicalIndex(index), child.attribute);
        }
        return;
    }

    if (isCompoundKind(spec->kind)) {
        const GroupAttribute group(value);
        if (!group.isValid()) {
            throw InvalidValueError::fromPlug(plug.name(), kindName(spec->kind),
                                              "compounds are set from a group keyed by child");
        }

        for (const auto child : group) {
            if (!spec->findChild(child.name)) {
                throw AttributeNotFoundError::fromName(plug.node().name(),
                                                       plug.partialName() + "." + child.name);
            }
            queueValue(modifier, plug.child(child.name), child.attribute);
        }
        return;
    }

    if (isEdgeOnlyKind(spec->kind)) {
        if (!value.isValid() || value.getType() == kAttrTypeNull) {
            return;
        }

        const StringAttribute reference(value);
        if (!reference.isValid()) {
            throw InvalidValueError::fromPlug(plug.name(), kindName(spec->kind),
                                              "message plugs only accept a plug name");
        }

        const Plug other = resolvePlugReference(modifier.scene(), reference.getValue("", false));
        if (other.isNull()) {
            throw InvalidValueError::fromPlug(plug.name(), kindName(spec->kind),
                                              "'" + reference.getValue("", false)
                                              + "' does not name a plug");
        }
        modifier.connect(plug, other);
        return;
    }

    modifier.setPlugValue(plug, value);
}

/// Takes the value apart when it runs, against the scene as it is then.
class SetValueCommand : public Modifier::Command
{
public:
    SetValueCommand(const Plug& plug, const Attribute& value)
        : mPlug(plug)
        , mValue(value)
    {}

    void doIt(Scene& scene) override
    {
        mBatch.reset(new Modifier(scene));
        queueValue(*mBatch, mPlug, mValue);
        mBatch->doIt();
    }

    void undoIt(Scene&) override
    {
        if (mBatch) {
            mBatch->undoIt();
        }
    }

    std::string describe() const override
    {
        return "setValue " + mPlug.partialName();
    }

private:
    Plug mPlug;
    Attribute mValue;
    std::unique_ptr<Modifier> mBatch;
};

//-----------------------------------------
// bounds

enum class Bound
{
    MIN,
    MAX,
    SOFT_MIN,
    SOFT_MAX,
};

const char*
boundName(Bound bound)
{
    switch (bound) {
    case Bound::MIN:      return "min";
    case Bound::MAX:      return "max";
    case Bound::SOFT_MIN: return "soft min";
    case Bound::SOFT_MAX: return "soft max";
    }

    return "";
}

Attribute AttributeSpec::*
boundMember(Bound bound)
{
    switch (bound) {
    case Bound::MIN:      return &AttributeSpec::minValue;
    case Bound::MAX:      return &AttributeSpec::maxValue;
    case Bound::SOFT_MIN: return &AttributeSpec::softMinValue;
    case Bound::SOFT_MAX: return &AttributeSpec::softMaxValue;
    }

    return &AttributeSpec::minValue;
}

bool
isHardBound(Bound bound)
{
    return bound == Bound::MIN || bound == Bound::MAX;
}

Attribute
enumBound(const AttributeSpec& spec, Bound bound)
{
    if (!isHardBound(bound) || spec.enumFields.empty()) {
        return {};
    }

    const auto compare = [](const EnumField& a, const EnumField& b) {
        return a.value < b.value;
    };

    const auto it = (bound == Bound::MIN)
            ? std::min_element(spec.enumFields.begin(), spec.enumFields.end(), compare)
            : std::max_element(spec.enumFields.begin(), spec.enumFields.end(), compare);

    return IntAttribute(it->value);
}

bool
hasBound(const Plug& plug, Bound bound)
{
    const AttributeSpec::Ptr spec = plug.spec();
    if (spec->kind == AttributeKind::ENUM) {
        return enumBound(*spec, bound).isValid();
    }
    if (!supportsBounds(spec->kind)) {
        return false;
    }

    return ((*spec).*boundMember(bound)).isValid();
}

Attribute
getBound(const Plug& plug, Bound bound)
{
    const AttributeSpec::Ptr spec = plug.spec();
    if (spec->kind == AttributeKind::ENUM) {
        return enumBound(*spec, bound);
    }
    if (!supportsBounds(spec->kind)) {
        throw UnsupportedKindOperationError::fromKind(plug.name(), kindName(spec->kind),
                                                      boundName(bound));
    }

    return (*spec).*boundMember(bound);
}

bool
setBound(const Plug& plug, Bound bound, const Attribute& value, Modifier* modifier)
{
    const AttributeSpec::Ptr spec = plug.spec();
    if (!supportsBounds(spec->kind)) {
        MgLogDebug("'" << plug.name() << "' of kind " << kindName(spec->kind)
                   << " has no " << boundName(bound));
        return false;
    }

    std::string error;
    const Attribute coerced = coerceToKind(spec->kind, value, &error);
    if (!coerced.isValid()) {
        MgLogWarn("Cannot set " << boundName(bound) << " of '" << plug.name() << "': " << error);
        return false;
    }

    ModifierScope scope(sceneOf(plug.node()), modifier);
    const auto member = boundMember(bound);
    scope->editAttribute(plug, [member, coerced](AttributeSpec& edited) {
        edited.*member = coerced;
    });
    scope.commit();

    return true;
}

} // anonymous namespace

namespace metagraph {
namespace plug_util {

//-----------------------------------------
// creation

Plug
addAttribute(const NodeHandle& node,
             const AttributeSpec::Ptr& spec,
             Modifier* modifier)
{
    if (Plug(node, spec->name).isValid()) {
        throw AttributeAlreadyExistsError::fromName(node.name(), spec->name);
    }

    ModifierScope scope(sceneOf(node), modifier);
    const Plug plug = scope->addAttribute(node, spec);
    scope.commit();

    return plug;
}

Plug
createAttribute(const NodeHandle& node,
                const std::string& name,
                AttributeKind kind,
                bool isArray,
                Modifier* modifier)
{
    return addAttribute(node, makeAttributeSpec(name, kind, isArray), modifier);
}

Plug
addCompoundAttribute(const NodeHandle& node,
                     const std::string& name,
                     const std::vector<AttributeSpec::Ptr>& children,
                     bool isArray,
                     Modifier* modifier)
{
    return addAttribute(node, makeCompoundSpec(name, children, isArray), modifier);
}

//-----------------------------------------
// values

std::string
elementKey(int64_t index)
{
    return "i" + std::to_string(index);
}

bool
parseElementKey(const std::string& key, int64_t& index)
{
    if (key.size() < 2 || key.size() > 19 || key[0] != 'i') {
        return false;
    }

    index = 0;
    for (std::size_t i = 1; i < key.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(key[i]))) {
            return false;
        }
        index = index * 10 + (key[i] - '0');
    }

    return true;
}

Attribute
getValue(const Plug& plug)
{
    const AttributeSpec::Ptr spec = plug.spec();

    if (plug.isArray()) {
        GroupBuilder gb;
        for (const Plug& element : plug.elements()) {
            const Attribute value = getValue(element);
            if (value.isValid()) {
                gb.set(elementKey(element.logicalIndex()), value);
            }
        }
        return gb.build();
    }

    if (isCompoundKind(spec->kind)) {
        GroupBuilder gb;
        for (const auto& child : spec->children) {
            const Attribute value = getValue(plug.child(child->name));
            if (value.isValid()) {
                gb.set(child->name, value);
            }
        }
        return gb.build();
    }

    return plug.value();
}

std::pair<AttributeKind, Attribute>
getValueAndKind(const Plug& plug)
{
    return { plug.kind(), getValue(plug) };
}

void
setValue(const Plug& plug, const Attribute& value, Modifier* modifier)
{
    // a batch may target a node it creates itself
    ModifierScope scope(modifier ? modifier->scene() : sceneOf(plug.node()), modifier);
    scope->addCommand(std::unique_ptr<Modifier::Command>(new SetValueCommand(plug, value)));
    scope.commit();
}

void
setValue(const Plug& plug, const Plug& other, Modifier* modifier)
{
    if (!isEdgeOnlyKind(plug.kind())) {
        setValue(plug, getValue(other), modifier);
        return;
    }

    const Plug source = plug.isArray() ? nextAvailableElement(plug) : plug;
    connectPlugs(source, other, false, modifier);
}

bool
isDefaultValue(const Plug& plug)
{
    const AttributeSpec::Ptr spec = plug.spec();

    if (plug.isArray()) {
        for (const Plug& element : plug.elements()) {
            if (!isDefaultValue(element)) {
                return false;
            }
        }
        return true;
    }

    if (isCompoundKind(spec->kind)) {
        for (const auto& child : spec->children) {
            if (!isDefaultValue(plug.child(child->name))) {
                return false;
            }
        }
        return true;
    }

    if (isEdgeOnlyKind(spec->kind) || !plug.hasStoredValue()) {
        return true;
    }

    return sameValue(plug.value(), leafDefault(*spec));
}

void
resetToDefault(const Plug& plug, Modifier* modifier)
{
    ModifierScope scope(sceneOf(plug.node()), modifier);
    for (const Plug& leaf : iterChildren(plug)) {
        if (holdsValue(leaf) && leaf.hasStoredValue()) {
            scope->setPlugValue(leaf, leafDefault(*leaf.spec()));
        }
    }
    scope.commit();
}

std::vector<Plug>
iterChildren(const Plug& plug)
{
    std::vector<Plug> result;

    if (plug.isArray()) {
        for (const Plug& element : plug.elements()) {
            const std::vector<Plug> below = iterChildren(element);
            result.insert(result.end(), below.begin(), below.end());
        }
    } else if (plug.isCompound()) {
        for (std::size_t i = 0; i < plug.numChildren(); ++i) {
            const std::vector<Plug> below = iterChildren(plug.child(i));
            result.insert(result.end(), below.begin(), below.end());
        }
    }

    result.push_back(plug);
    return result;
}

//-----------------------------------------
// metadata

Attribute
plugDefault(const Plug& plug)
{
    const AttributeSpec::Ptr spec = plug.spec();
    if (!supportsDefault(spec->kind)) {
        return {};
    }

    return leafDefault(*spec);
}

bool
setPlugDefault(const Plug& plug, const Attribute& value, Modifier* modifier)
{
    const AttributeSpec::Ptr spec = plug.spec();
    if (!supportsDefault(spec->kind)) {
        return false;
    }

    std::string error;
    const Attribute coerced = coerceToKind(spec->kind, value, &error);
    if (!coerced.isValid()) {
        throw InvalidValueError::fromPlug(plug.name(), kindName(spec->kind), error);
    }

    ModifierScope scope(sceneOf(plug.node()), modifier);
    scope->editAttribute(plug, [coerced](AttributeSpec& edited) {
        edited.defaultValue = coerced;
    });
    scope.commit();

    return true;
}

bool hasPlugMin(const Plug& plug)     { return hasBound(plug, Bound::MIN); }
bool hasPlugMax(const Plug& plug)     { return hasBound(plug, Bound::MAX); }
bool hasPlugSoftMin(const Plug& plug) { return hasBound(plug, Bound::SOFT_MIN); }
bool hasPlugSoftMax(const Plug& plug) { return hasBound(plug, Bound::SOFT_MAX); }

Attribute plugMin(const Plug& plug)     { return getBound(plug, Bound::MIN); }
Attribute plugMax(const Plug& plug)     { return getBound(plug, Bound::MAX); }
Attribute plugSoftMin(const Plug& plug) { return getBound(plug, Bound::SOFT_MIN); }
Attribute plugSoftMax(const Plug& plug) { return getBound(plug, Bound::SOFT_MAX); }

bool
setPlugMin(const Plug& plug, const Attribute& value, Modifier* modifier)
{
    return setBound(plug, Bound::MIN, value, modifier);
}

bool
setPlugMax(const Plug& plug, const Attribute& value, Modifier* modifier)
{
    return setBound(plug, Bound::MAX, value, modifier);
}

bool
setPlugSoftMin(const Plug& plug, const Attribute& value, Modifier* modifier)
{
    return setBound(plug, Bound::SOFT_MIN, value, modifier);
}

bool
setPlugSoftMax(const Plug& plug, const Attribute& value, Modifier* modifier)
{
    return setBound(plug, Bound::SOFT_MAX, value, modifier);
}

StringVector
enumNames(const Plug& plug)
{
    StringVector names;
    for (const EnumField& field : plug.spec()->enumFields) {
        names.push_back(field.name);
    }

    return names;
}

IntVector
enumIndices(const Plug& plug)
{
    IntVector indices;
    for (const EnumField& field : plug.spec()->enumFields) {
        indices.push_back(field.value);
    }

    return indices;
}

//-----------------------------------------
// arrays

Plug
nextAvailableElement(const Plug& arrayPlug)
{
    const std::vector<int64_t> indices = arrayPlug.existingIndices();
    for (const int64_t index : indices) {
        const Plug element = arrayPlug.elementByLogicalIndex(index);
        if (element.connectionsBelow(true, true).empty()) {
            return element;
        }
    }

    return arrayPlug.elementByLogicalIndex(indices.empty() ? 0 : indices.back() + 1);
}

void
removeElement(const Plug& arrayPlug, int64_t index, Modifier* modifier)
{
    ModifierScope scope(sceneOf(arrayPlug.node()), modifier);
    scope->removeElement(arrayPlug.elementByLogicalIndex(index));
    scope.commit();
}

void
removeUnconnectedEmptyElements(const Plug& arrayPlug, Modifier* modifier)
{
    ModifierScope scope(sceneOf(arrayPlug.node()), modifier);
    for (const Plug& element : arrayPlug.elements()) {
        if (element.connectionsBelow(true, true).empty()) {
            scope->removeElement(element);
        }
    }
    scope.commit();
}

//-----------------------------------------
// connections and locks

void
connectPlugs(const Plug& source,
             const Plug& destination,
             bool force,
             Modifier* modifier)
{
    ModifierScope scope(sceneOf(destination.node()), modifier);

    const Plug existing = destination.source();
    if (!existing.isNull()) {
        if (existing == source) {
            return;
        }
        if (!force) {
            throw ConnectionConflictError::fromPlugs(
                    source.name(), destination.name(),
                    "destination is already connected to '" + existing.name() + "'");
        }
        scope->disconnect(existing, destination);
    }

    scope->connect(source, destination);
    scope.commit();
}

void
disconnectPlug(const Plug& plug,
               bool source,
               bool destination,
               Modifier* modifier)
{
    ModifierScope scope(sceneOf(plug.node()), modifier);

    if (source) {
        const Plug sourcePlug = plug.source();
        if (!sourcePlug.isNull()) {
            unlockPlug(plug, &*scope);
            scope->disconnect(sourcePlug, plug);
        }
    }

    if (destination) {
        for (const Plug& destinationPlug : plug.destinations()) {
            unlockPlug(destinationPlug, &*scope);
            scope->disconnect(plug, destinationPlug);
        }
    }

    scope.commit();
}

std::vector<Plug>
unlockPlug(const Plug& plug, Modifier* modifier)
{
    std::vector<Plug> cleared;

    ModifierScope scope(sceneOf(plug.node()), modifier);
    for (Plug current = plug; !current.isNull(); current = current.parent()) {
        if (current.isLocked()) {
            scope->setPlugLocked(current, false);
            cleared.push_back(current);
        }
    }
    scope.commit();

    return cleared;
}

bool
setLockState(const Plug& plug, bool state, Modifier* modifier)
{
    if (plug.isLocked() == state) {
        return false;
    }

    ModifierScope scope(sceneOf(plug.node()), modifier);
    scope->setPlugLocked(plug, state);
    scope.commit();

    return true;
}

} // namespace plug_util
} // namespace metagraph

