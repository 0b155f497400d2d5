// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#include "PlugSerialization.h"
#include "PlugUtil.h"

// metagraph
#include <metagraph/Errors.h>
#include <metagraph/attribute/AttributeUtils.h>
#include <metagraph/logging/MetaGraphLogging.h>

namespace {

MgLogSetup("PlugSerialization");

using namespace metagraph;

const std::string kName("name");
const std::string kKind("kind");
const std::string kValue("value");
const std::string kIsDynamic("isDynamic");
const std::string kIsArray("isArray");
const std::string kDefault("default");
const std::string kMin("min");
const std::string kMax("max");
const std::string kSoftMin("softMin");
const std::string kSoftMax("softMax");
const std::string kEnumOptions("enumOptions");
const std::string kEnumIndices("enumIndices");
const std::string kKeyable("keyable");
const std::string kChannelBox("channelBox");
const std::string kLocked("locked");
const std::string kChildren("children");

void
setIfValid(GroupBuilder& gb, const std::string& key, const Attribute& attr)
{
    if (attr.isValid()) {
        gb.set(key, attr);
    }
}

} // anonymous namespace

namespace metagraph {
namespace plug_util {

GroupAttribute
serializeAttributeSpec(const AttributeSpec& spec)
{
    GroupBuilder gb;
    gb.set(kName, StringAttribute(spec.name));
    gb.set(kKind, StringAttribute(kindName(spec.kind)));
    gb.set(kIsArray, IntAttribute(spec.isArray ? 1 : 0));
    gb.set(kKeyable, IntAttribute(spec.keyable ? 1 : 0));
    gb.set(kChannelBox, IntAttribute(spec.channelBox ? 1 : 0));

    setIfValid(gb, kDefault, spec.defaultValue);
    setIfValid(gb, kMin, spec.minValue);
    setIfValid(gb, kMax, spec.maxValue);
    setIfValid(gb, kSoftMin, spec.softMinValue);
    setIfValid(gb, kSoftMax, spec.softMaxValue);

    if (spec.kind == AttributeKind::ENUM) {
        StringVector names;
        IntVector indices;
        for (const EnumField& field : spec.enumFields) {
            names.push_back(field.name);
            indices.push_back(field.value);
        }
        gb.set(kEnumOptions, StringAttribute(names));
        gb.set(kEnumIndices, IntAttribute(indices.data(), indices.size(), 1));
    }

    if (!spec.children.empty()) {
        GroupBuilder childrenGb;
        for (std::size_t i = 0; i < spec.children.size(); ++i) {
            childrenGb.set(std::to_string(i), serializeAttributeSpec(*spec.children[i]));
        }
        gb.set(kChildren, childrenGb.build());
    }

    return gb.build();
}

AttributeSpec::Ptr
deserializeAttributeSpec(const GroupAttribute& record)
{
    const std::string name = stringValue(record.getChildByName(kName));
    const auto kind = kindFromName(stringValue(record.getChildByName(kKind)));
    if (name.empty() || !kind) {
        MgLogWarn("Invalid attribute definition '" << name << "'");
        return nullptr;
    }

    auto spec = std::make_shared<AttributeSpec>();
    spec->name = name;
    spec->kind = *kind;
    spec->isArray = boolValue(record.getChildByName(kIsArray));
    spec->keyable = boolValue(record.getChildByName(kKeyable));
    spec->channelBox = boolValue(record.getChildByName(kChannelBox));

    spec->defaultValue = coerceToKind(*kind, record.getChildByName(kDefault));
    spec->minValue = coerceToKind(*kind, record.getChildByName(kMin));
    spec->maxValue = coerceToKind(*kind, record.getChildByName(kMax));
    spec->softMinValue = coerceToKind(*kind, record.getChildByName(kSoftMin));
    spec->softMaxValue = coerceToKind(*kind, record.getChildByName(kSoftMax));

    if (*kind == AttributeKind::ENUM) {
        const StringVector names = stringValues(record.getChildByName(kEnumOptions));
        const IntVector indices = numericValues<int>(record.getChildByName(kEnumIndices));
        for (std::size_t i = 0; i < names.size(); ++i) {
            const int value = (i < indices.size()) ? indices[i] : static_cast<int>(i);
            spec->enumFields.push_back({ names[i], value });
        }
    }

    const GroupAttribute children = record.getChildByName(kChildren);
    if (children.isValid()) {
        for (const auto child : children) {
            AttributeSpec::Ptr childSpec = deserializeAttributeSpec(child.attribute);
            if (!childSpec) {
                return nullptr;
            }
            spec->children.push_back(std::move(childSpec));
        }
    }

    return spec;
}

GroupAttribute
serializePlug(const Plug& plug)
{
    const AttributeSpec::Ptr spec = plug.spec();
    if (!spec->isDynamic && isDefaultValue(plug)) {
        return {};
    }

    GroupBuilder gb;
    gb.update(serializeAttributeSpec(*spec));
    gb.set(kName, StringAttribute(plug.partialName()));
    gb.set(kIsDynamic, IntAttribute(spec->isDynamic ? 1 : 0));
    gb.set(kLocked, IntAttribute(plug.isLocked() ? 1 : 0));
    setIfValid(gb, kValue, getValue(plug));

    return gb.build();
}

Plug
deserializePlug(const NodeHandle& node,
                const GroupAttribute& record,
                Modifier* modifier)
{
    const std::string name = stringValue(record.getChildByName(kName));
    const bool isDynamic = boolValue(record.getChildByName(kIsDynamic));
    const bool keyable = boolValue(record.getChildByName(kKeyable));
    const bool channelBox = boolValue(record.getChildByName(kChannelBox));
    const bool locked = boolValue(record.getChildByName(kLocked));
    const Attribute value = record.getChildByName(kValue);

    // throws if the node is gone
    node.data();
    ModifierScope scope(*node.scene(), modifier);

    Plug plug;
    if (isDynamic) {
        const AttributeSpec::Ptr spec = deserializeAttributeSpec(record);
        if (!spec) {
            throw InvalidValueError::fromPlug(node.name() + "." + name, "record",
                                              "invalid attribute definition");
        }
        if (Plug(node, spec->name).isValid()) {
            throw AttributeAlreadyExistsError::fromName(node.name(), spec->name);
        }
        plug = scope->addAttribute(node, spec);
    } else {
        plug = Plug::fromPath(node, name);
        if (!plug.isValid()) {
            throw AttributeNotFoundError::fromName(node.name(), name);
        }
        scope->editAttribute(plug, [keyable, channelBox](AttributeSpec& edited) {
            edited.keyable = keyable;
            edited.channelBox = channelBox;
        });
    }

    if (value.isValid()) {
        setValue(plug, value, &*scope);
    }
    if (locked) {
        scope->setPlugLocked(plug, true);
    }

    scope.commit();
    return plug;
}

} // namespace plug_util
} // namespace metagraph

