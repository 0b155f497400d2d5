// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

// metagraph
#include <metagraph/attribute/Attribute.h>

// stl
#include <optional>
#include <string>
#include <vector>

namespace metagraph {

/**
 * Closed set of value shapes an attribute slot can hold. The kind of a slot
 * is fixed when the slot is created and determines its storage attribute
 * type, tuple size, and whether it holds a value at all (MESSAGE holds none,
 * the connection is the information).
 *
 * Numeric values match the persisted integer tags used by older scenes.
 */
enum class AttributeKind : int
{
    BOOLEAN      = 0,
    SHORT        = 1,
    INT          = 2,
    LONG         = 3,
    FLOAT        = 4,
    DOUBLE       = 5,
    ADDR         = 6,
    BYTE         = 7,
    CHAR         = 8,

    // unit attributes, stored as doubles in UI units (cm, degrees, frames)
    DISTANCE     = 9,
    ANGLE        = 10,
    TIME         = 11,

    ENUM         = 12,

    STRING       = 13,
    MATRIX       = 14,

    // typed data arrays, a single value holding any number of tuples
    FLOAT_ARRAY  = 15,
    DOUBLE_ARRAY = 16,
    INT_ARRAY    = 17,
    POINT_ARRAY  = 18,
    VECTOR_ARRAY = 19,
    STRING_ARRAY = 20,
    MATRIX_ARRAY = 21,

    COMPOUND     = 22,
    INT64        = 23,

    DOUBLE2      = 25,
    FLOAT2       = 26,
    INT2         = 27,
    LONG2        = 28,
    SHORT2       = 29,
    DOUBLE3      = 30,
    FLOAT3       = 31,
    INT3         = 32,
    LONG3        = 33,
    SHORT3       = 34,
    DOUBLE4      = 35,

    MESSAGE      = 36,
};

/// Every kind, in tag order.
const std::vector<AttributeKind>& allAttributeKinds();

/// Stable lower camel case name used in serialized records, e.g. "double3".
const char* kindName(AttributeKind kind);

std::optional<AttributeKind> kindFromName(const std::string& name);

std::optional<AttributeKind> kindFromTag(int tag);

/// Storage type of the kind's value (kAttrTypeInt, kAttrTypeDouble, ...).
AttributeType kindStorageType(AttributeKind kind);

/// Number of components per value; 16 for matrices, 3 for point arrays.
int64_t kindTupleSize(AttributeKind kind);

bool isNumericKind(AttributeKind kind);
bool isUnitKind(AttributeKind kind);
bool isVectorKind(AttributeKind kind);
bool isDataArrayKind(AttributeKind kind);
bool isEdgeOnlyKind(AttributeKind kind);
bool isCompoundKind(AttributeKind kind);

/// Kinds whose values may be bounded by min/max and soft min/max.
bool supportsBounds(AttributeKind kind);

/// Kinds that carry a default value in their definition.
bool supportsDefault(AttributeKind kind);

/**
 * The value a freshly created slot of this kind holds: zero tuples,
 * identity matrices, empty strings and empty data arrays. Returns an invalid
 * attribute for MESSAGE and COMPOUND.
 */
Attribute kindDefaultValue(AttributeKind kind);

/**
 * Converts value to the storage the kind expects: numeric storage types are
 * converted between each other, booleans are normalized to 0/1, and the
 * number of values is checked against the tuple size. Integer kinds refuse
 * values with a fractional part. Returns an invalid
 * attribute and sets errorMessage when the value does not fit.
 */
Attribute coerceToKind(AttributeKind kind,
                       const Attribute& value,
                       std::string* errorMessage = nullptr);

} // namespace metagraph

