// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

// foundry
#include <FnAttribute/FnAttribute.h>
#include <FnAttribute/FnGroupBuilder.h>

// stl
#include <iosfwd>
#include <iterator>
#include <string>
#include <vector>

namespace metagraph {

using namespace FnAttribute;

// AttributeType values, the storage type of an FnAttribute. Every
// AttributeKind maps onto exactly one of these.
using AttributeType = int32_t;

constexpr AttributeType kAttrTypeNull   = kFnKatAttributeTypeNull;
constexpr AttributeType kAttrTypeInt    = kFnKatAttributeTypeInt;
constexpr AttributeType kAttrTypeFloat  = kFnKatAttributeTypeFloat;
constexpr AttributeType kAttrTypeDouble = kFnKatAttributeTypeDouble;
constexpr AttributeType kAttrTypeString = kFnKatAttributeTypeString;
constexpr AttributeType kAttrTypeGroup  = kFnKatAttributeTypeGroup;
constexpr AttributeType kAttrTypeError  = kFnKatAttributeTypeError;

using Int    = IntAttribute::value_type;
using Float  = FloatAttribute::value_type;
using Double = DoubleAttribute::value_type;

using IntVector    = std::vector<Int>;
using FloatVector  = std::vector<Float>;
using DoubleVector = std::vector<Double>;
using StringVector = std::vector<std::string>;

/**
 * Forward iterator enabling FnAttribute::GroupAttribute to be used with a
 * range-based for loop.
 *
 * for (auto child : groupAttr) {
 *     const std::string& childName = child.name;
 *     const metagraph::Attribute& childAttr = child.attribute;
 * }
 */
struct GroupAttributeChild
{
    const std::string name;
    const metagraph::Attribute attribute;
};

class GroupAttributeConstIterator
{
public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = GroupAttributeChild;
    using difference_type = std::ptrdiff_t;
    using pointer = const GroupAttributeChild*;
    using reference = GroupAttributeChild;

    GroupAttributeConstIterator(const metagraph::GroupAttribute& attr, int64_t i)
        : mAttr(attr)
        , mIdx(i)
    {}

    inline GroupAttributeChild operator*() const {
        return { mAttr.getChildName(mIdx), mAttr.getChildByIndex(mIdx) };
    }

    inline GroupAttributeConstIterator& operator++() {
        ++mIdx;
        return *this;
    }

    inline bool operator==(const GroupAttributeConstIterator& other) const {
        return mIdx == other.mIdx;
    }

    inline bool operator!=(const GroupAttributeConstIterator& other) const {
        return !operator==(other);
    }

private:
    metagraph::GroupAttribute mAttr;
    int64_t mIdx;
};

void print(std::ostream&, const metagraph::Attribute&, unsigned indent = 0);

/// Single line rendering of an attribute, for log and error messages.
std::string toString(const metagraph::Attribute&);

} // namespace metagraph

// pretty printer
std::ostream& operator<<(std::ostream& o, const metagraph::Attribute& attribute);

// begin() and end() functions need to be in the namespace of the object being
// iterated over for the range-based for to work. GroupAttribute is in
// FnAttribute namespace.
FNATTRIBUTE_NAMESPACE_ENTER
{

inline metagraph::GroupAttributeConstIterator
begin(const metagraph::GroupAttribute& attr)
{
    return metagraph::GroupAttributeConstIterator(attr, 0);
}

inline metagraph::GroupAttributeConstIterator
end(const metagraph::GroupAttribute& attr)
{
    return metagraph::GroupAttributeConstIterator(attr, attr.getNumberOfChildren());
}

}
FNATTRIBUTE_NAMESPACE_EXIT

