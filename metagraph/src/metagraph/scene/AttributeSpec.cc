// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#include "AttributeSpec.h"

namespace metagraph {

AttributeSpec::Ptr
AttributeSpec::clone() const
{
    Ptr copy = std::make_shared<AttributeSpec>(*this);
    for (auto& child : copy->children) {
        child = child->clone();
    }

    return copy;
}

AttributeSpec::Ptr
AttributeSpec::findChild(const std::string& childName) const
{
    for (const auto& child : children) {
        if (child->name == childName) {
            return child;
        }
    }

    return nullptr;
}

AttributeSpec::Ptr
makeAttributeSpec(const std::string& name, AttributeKind kind, bool isArray)
{
    auto spec = std::make_shared<AttributeSpec>();
    spec->name = name;
    spec->kind = kind;
    spec->isArray = isArray;

    if (supportsDefault(kind)) {
        spec->defaultValue = kindDefaultValue(kind);
    }

    return spec;
}

AttributeSpec::Ptr
makeEnumSpec(const std::string& name,
             const std::vector<EnumField>& fields,
             int defaultValue)
{
    auto spec = makeAttributeSpec(name, AttributeKind::ENUM);
    spec->enumFields = fields;
    spec->defaultValue = IntAttribute(defaultValue);

    return spec;
}

AttributeSpec::Ptr
makeCompoundSpec(const std::string& name,
                 const std::vector<AttributeSpec::Ptr>& children,
                 bool isArray)
{
    auto spec = makeAttributeSpec(name, AttributeKind::COMPOUND, isArray);
    for (const auto& child : children) {
        auto childSpec = child->clone();
        childSpec->isDynamic = spec->isDynamic;
        spec->children.push_back(std::move(childSpec));
    }

    return spec;
}

std::vector<EnumField>
enumFieldsFromNames(const StringVector& names)
{
    std::vector<EnumField> fields;
    fields.reserve(names.size());

    int value = 0;
    for (const auto& name : names) {
        fields.push_back({ name, value++ });
    }

    return fields;
}

} // namespace metagraph

