// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#include "AttributeKind.h"

// stl
#include <cmath>
#include <sstream>

namespace {

using namespace metagraph;

enum class KindClass
{
    NUMERIC,
    UNIT,
    ENUM,
    STRING,
    MATRIX,
    DATA_ARRAY,
    COMPOUND,
    MESSAGE
};

struct KindInfo
{
    AttributeKind mKind;
    const char* mName;
    KindClass mClass;
    AttributeType mStorage;
    int64_t mTupleSize;
};

const KindInfo kKindTable[] = {
    { AttributeKind::BOOLEAN,      "bool",        KindClass::NUMERIC,    kAttrTypeInt,    1 },
    { AttributeKind::SHORT,        "short",       KindClass::NUMERIC,    kAttrTypeInt,    1 },
    { AttributeKind::INT,          "int",         KindClass::NUMERIC,    kAttrTypeInt,    1 },
    { AttributeKind::LONG,         "long",        KindClass::NUMERIC,    kAttrTypeInt,    1 },
    { AttributeKind::FLOAT,        "float",       KindClass::NUMERIC,    kAttrTypeFloat,  1 },
    { AttributeKind::DOUBLE,       "double",      KindClass::NUMERIC,    kAttrTypeDouble, 1 },
    { AttributeKind::ADDR,         "addr",        KindClass::NUMERIC,    kAttrTypeDouble, 1 },
    { AttributeKind::BYTE,         "byte",        KindClass::NUMERIC,    kAttrTypeInt,    1 },
    { AttributeKind::CHAR,         "char",        KindClass::NUMERIC,    kAttrTypeInt,    1 },
    { AttributeKind::DISTANCE,     "distance",    KindClass::UNIT,       kAttrTypeDouble, 1 },
    { AttributeKind::ANGLE,        "angle",       KindClass::UNIT,       kAttrTypeDouble, 1 },
    { AttributeKind::TIME,         "time",        KindClass::UNIT,       kAttrTypeDouble, 1 },
    { AttributeKind::ENUM,         "enum",        KindClass::ENUM,       kAttrTypeInt,    1 },
    { AttributeKind::STRING,       "string",      KindClass::STRING,     kAttrTypeString, 1 },
    { AttributeKind::MATRIX,       "matrix",      KindClass::MATRIX,     kAttrTypeDouble, 16 },
    { AttributeKind::FLOAT_ARRAY,  "floatArray",  KindClass::DATA_ARRAY, kAttrTypeFloat,  1 },
    { AttributeKind::DOUBLE_ARRAY, "doubleArray", KindClass::DATA_ARRAY, kAttrTypeDouble, 1 },
    { AttributeKind::INT_ARRAY,    "intArray",    KindClass::DATA_ARRAY, kAttrTypeInt,    1 },
    { AttributeKind::POINT_ARRAY,  "pointArray",  KindClass::DATA_ARRAY, kAttrTypeDouble, 3 },
    { AttributeKind::VECTOR_ARRAY, "vectorArray", KindClass::DATA_ARRAY, kAttrTypeDouble, 3 },
    { AttributeKind::STRING_ARRAY, "stringArray", KindClass::DATA_ARRAY, kAttrTypeString, 1 },
    { AttributeKind::MATRIX_ARRAY, "matrixArray", KindClass::DATA_ARRAY, kAttrTypeDouble, 16 },
    { AttributeKind::COMPOUND,     "compound",    KindClass::COMPOUND,   kAttrTypeGroup,  0 },
    { AttributeKind::INT64,        "int64",       KindClass::NUMERIC,    kAttrTypeDouble, 1 },
    { AttributeKind::DOUBLE2,      "double2",     KindClass::NUMERIC,    kAttrTypeDouble, 2 },
    { AttributeKind::FLOAT2,       "float2",      KindClass::NUMERIC,    kAttrTypeFloat,  2 },
    { AttributeKind::INT2,         "int2",        KindClass::NUMERIC,    kAttrTypeInt,    2 },
    { AttributeKind::LONG2,        "long2",       KindClass::NUMERIC,    kAttrTypeInt,    2 },
    { AttributeKind::SHORT2,       "short2",      KindClass::NUMERIC,    kAttrTypeInt,    2 },
    { AttributeKind::DOUBLE3,      "double3",     KindClass::NUMERIC,    kAttrTypeDouble, 3 },
    { AttributeKind::FLOAT3,       "float3",      KindClass::NUMERIC,    kAttrTypeFloat,  3 },
    { AttributeKind::INT3,         "int3",        KindClass::NUMERIC,    kAttrTypeInt,    3 },
    { AttributeKind::LONG3,        "long3",       KindClass::NUMERIC,    kAttrTypeInt,    3 },
    { AttributeKind::SHORT3,       "short3",      KindClass::NUMERIC,    kAttrTypeInt,    3 },
    { AttributeKind::DOUBLE4,      "double4",     KindClass::NUMERIC,    kAttrTypeDouble, 4 },
    { AttributeKind::MESSAGE,      "message",     KindClass::MESSAGE,    kAttrTypeNull,   0 },
};

const KindInfo&
kindInfo(AttributeKind kind)
{
    for (const KindInfo& info : kKindTable) {
        if (info.mKind == kind) {
            return info;
        }
    }

    // every enumerator has a table entry
    return kKindTable[0];
}

template <class AttrT>
bool
readNumericValues(const Attribute& value, std::vector<double>& out)
{
    AttrT attr(value);
    if (!attr.isValid()) {
        return false;
    }

    const auto sample = attr.getNearestSample(0.f);
    out.assign(sample.begin(), sample.end());
    return true;
}

template <class AttrT>
Attribute
buildNumeric(const std::vector<double>& values, int64_t tupleSize, bool round)
{
    using value_type = typename AttrT::value_type;

    std::vector<value_type> converted;
    converted.reserve(values.size());
    for (const double v : values) {
        converted.push_back(static_cast<value_type>(round ? std::llround(v) : v));
    }

    return AttrT(converted.data(), static_cast<int64_t>(converted.size()), tupleSize);
}

Attribute
buildStorage(AttributeType storage, const std::vector<double>& values, int64_t tupleSize)
{
    switch (storage) {
    case kAttrTypeInt:
        return buildNumeric<IntAttribute>(values, tupleSize, true);
    case kAttrTypeFloat:
        return buildNumeric<FloatAttribute>(values, tupleSize, false);
    case kAttrTypeDouble:
        return buildNumeric<DoubleAttribute>(values, tupleSize, false);
    default:
        return {};
    }
}

Attribute
fail(std::string* errorMessage, const std::string& message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
    return {};
}

} // anonymous namespace

namespace metagraph {

const std::vector<AttributeKind>&
allAttributeKinds()
{
    static const std::vector<AttributeKind> sKinds = [] {
        std::vector<AttributeKind> kinds;
        for (const KindInfo& info : kKindTable) {
            kinds.push_back(info.mKind);
        }
        return kinds;
    }();

    return sKinds;
}

const char*
kindName(AttributeKind kind)
{
    return kindInfo(kind).mName;
}

std::optional<AttributeKind>
kindFromName(const std::string& name)
{
    for (const KindInfo& info : kKindTable) {
        if (name == info.mName) {
            return info.mKind;
        }
    }

    return std::nullopt;
}

std::optional<AttributeKind>
kindFromTag(int tag)
{
    for (const KindInfo& info : kKindTable) {
        if (static_cast<int>(info.mKind) == tag) {
            return info.mKind;
        }
    }

    return std::nullopt;
}

AttributeType
kindStorageType(AttributeKind kind)
{
    return kindInfo(kind).mStorage;
}

int64_t
kindTupleSize(AttributeKind kind)
{
    return kindInfo(kind).mTupleSize;
}

bool
isNumericKind(AttributeKind kind)
{
    return kindInfo(kind).mClass == KindClass::NUMERIC;
}

bool
isUnitKind(AttributeKind kind)
{
    return kindInfo(kind).mClass == KindClass::UNIT;
}

bool
isVectorKind(AttributeKind kind)
{
    return isNumericKind(kind) && kindTupleSize(kind) > 1;
}

bool
isDataArrayKind(AttributeKind kind)
{
    return kindInfo(kind).mClass == KindClass::DATA_ARRAY;
}

bool
isEdgeOnlyKind(AttributeKind kind)
{
    return kind == AttributeKind::MESSAGE;
}

bool
isCompoundKind(AttributeKind kind)
{
    return kind == AttributeKind::COMPOUND;
}

bool
supportsBounds(AttributeKind kind)
{
    switch (kind) {
    case AttributeKind::BOOLEAN:
    case AttributeKind::ADDR:
        return false;
    default:
        break;
    }

    const KindClass kindClass = kindInfo(kind).mClass;
    return kindClass == KindClass::NUMERIC || kindClass == KindClass::UNIT;
}

bool
supportsDefault(AttributeKind kind)
{
    switch (kindInfo(kind).mClass) {
    case KindClass::NUMERIC:
    case KindClass::UNIT:
    case KindClass::ENUM:
    case KindClass::STRING:
    case KindClass::MATRIX:
        return true;
    default:
        return false;
    }
}

Attribute
kindDefaultValue(AttributeKind kind)
{
    const KindInfo& info = kindInfo(kind);

    switch (info.mClass) {
    case KindClass::NUMERIC:
    case KindClass::UNIT:
    case KindClass::ENUM:
        return buildStorage(info.mStorage,
                            std::vector<double>(info.mTupleSize, 0.0),
                            info.mTupleSize);
    case KindClass::STRING:
        return StringAttribute("");
    case KindClass::MATRIX:
    {
        std::vector<double> identity(16, 0.0);
        identity[0] = identity[5] = identity[10] = identity[15] = 1.0;
        return DoubleAttribute(identity.data(), 16, 16);
    }
    case KindClass::DATA_ARRAY:
        if (info.mStorage == kAttrTypeString) {
            return StringAttribute(StringVector{}, 1);
        }
        return buildStorage(info.mStorage, {}, info.mTupleSize);
    case KindClass::COMPOUND:
    case KindClass::MESSAGE:
        break;
    }

    return {};
}

Attribute
coerceToKind(AttributeKind kind, const Attribute& value, std::string* errorMessage)
{
    const KindInfo& info = kindInfo(kind);

    if (!value.isValid()) {
        return fail(errorMessage, "value is invalid");
    }

    if (info.mClass == KindClass::MESSAGE || info.mClass == KindClass::COMPOUND) {
        return fail(errorMessage, "kind holds no direct value");
    }

    const bool fixedCount = (info.mClass != KindClass::DATA_ARRAY);

    if (info.mStorage == kAttrTypeString) {
        const StringAttribute stringAttr(value);
        if (!stringAttr.isValid()) {
            return fail(errorMessage, "expected a string attribute");
        }
        if (fixedCount && stringAttr.getNumberOfValues() != 1) {
            return fail(errorMessage, "expected exactly one string");
        }
        return stringAttr;
    }

    std::vector<double> values;
    if (!readNumericValues<IntAttribute>(value, values)
            && !readNumericValues<FloatAttribute>(value, values)
            && !readNumericValues<DoubleAttribute>(value, values)) {
        return fail(errorMessage, "expected a numeric attribute");
    }

    const int64_t count = static_cast<int64_t>(values.size());
    if (fixedCount && count != info.mTupleSize) {
        std::ostringstream ss;
        ss << "expected " << info.mTupleSize << " values, got " << count;
        return fail(errorMessage, ss.str());
    }
    if (!fixedCount && count % info.mTupleSize != 0) {
        std::ostringstream ss;
        ss << "value count " << count << " is not a multiple of " << info.mTupleSize;
        return fail(errorMessage, ss.str());
    }

    if (kind == AttributeKind::BOOLEAN) {
        values[0] = (values[0] != 0.0) ? 1.0 : 0.0;
    }

    if (info.mStorage == kAttrTypeInt || kind == AttributeKind::INT64) {
        for (const double v : values) {
            if (std::trunc(v) != v) {
                std::ostringstream ss;
                ss << "value " << v << " has a fractional part";
                return fail(errorMessage, ss.str());
            }
        }
    }

    return buildStorage(info.mStorage, values, info.mTupleSize);
}

} // namespace metagraph

