// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

// metagraph
#include <metagraph/attribute/Attribute.h>
#include <metagraph/attribute/AttributeKind.h>

// stl
#include <memory>
#include <string>
#include <vector>

namespace metagraph {

struct EnumField
{
    std::string name;
    int value;
};

inline bool operator==(const EnumField& a, const EnumField& b)
{
    return a.name == b.name && a.value == b.value;
}

/**
 * Definition of an attribute on a node: its kind, whether it is a sparse
 * array of elements, its UI flags and its value metadata. Compound
 * attributes own the definitions of their children.
 *
 * Static attributes are copied from the node type when a node is created;
 * dynamic attributes are added afterwards and are the only ones that can be
 * removed or renamed.
 */
struct AttributeSpec
{
    using Ptr = std::shared_ptr<AttributeSpec>;

    std::string name;
    AttributeKind kind = AttributeKind::DOUBLE;
    bool isArray = false;
    bool isDynamic = true;
    bool keyable = false;
    bool channelBox = false;

    Attribute defaultValue;
    Attribute minValue;
    Attribute maxValue;
    Attribute softMinValue;
    Attribute softMaxValue;

    std::vector<EnumField> enumFields;
    std::vector<Ptr> children;

    /// Deep copy, children included.
    Ptr clone() const;

    Ptr findChild(const std::string& childName) const;
};

/// Attribute definition with the kind's default value.
AttributeSpec::Ptr makeAttributeSpec(const std::string& name,
                                     AttributeKind kind,
                                     bool isArray = false);

AttributeSpec::Ptr makeEnumSpec(const std::string& name,
                                const std::vector<EnumField>& fields,
                                int defaultValue = 0);

AttributeSpec::Ptr makeCompoundSpec(const std::string& name,
                                    const std::vector<AttributeSpec::Ptr>& children,
                                    bool isArray = false);

/// Builds enum fields numbered from 0 in the given order.
std::vector<EnumField> enumFieldsFromNames(const StringVector& names);

} // namespace metagraph

