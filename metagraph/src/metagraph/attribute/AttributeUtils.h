// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

// metagraph
#include <metagraph/attribute/Attribute.h>

// Imath
#include <OpenEXR/ImathMatrix.h>
#include <OpenEXR/ImathVec.h>

// stl
#include <string>
#include <vector>

namespace metagraph {

inline const char*
attrTypeName(AttributeType type)
{
    switch (type) {
    case kAttrTypeNull:   return "null";
    case kAttrTypeInt:    return "int";
    case kAttrTypeFloat:  return "float";
    case kAttrTypeDouble: return "double";
    case kAttrTypeString: return "string";
    case kAttrTypeGroup:  return "group";
    default:              return "error";
    }
}

/**
 * Reads the first value of any numeric attribute as T.
 * Returns defValue if the attribute is not numeric or has no values.
 */
template <class T>
T
numericValue(const Attribute& attr, T defValue = T())
{
    const IntAttribute intAttr(attr);
    if (intAttr.isValid() && intAttr.getNumberOfValues() > 0) {
        return static_cast<T>(intAttr.getValue(0, false));
    }

    const FloatAttribute floatAttr(attr);
    if (floatAttr.isValid() && floatAttr.getNumberOfValues() > 0) {
        return static_cast<T>(floatAttr.getValue(0.f, false));
    }

    const DoubleAttribute doubleAttr(attr);
    if (doubleAttr.isValid() && doubleAttr.getNumberOfValues() > 0) {
        return static_cast<T>(doubleAttr.getValue(0.0, false));
    }

    return defValue;
}

/// All values of any numeric attribute, converted to T.
template <class T>
std::vector<T>
numericValues(const Attribute& attr)
{
    std::vector<T> result;

    const IntAttribute intAttr(attr);
    if (intAttr.isValid()) {
        const auto sample = intAttr.getNearestSample(0.f);
        result.assign(sample.begin(), sample.end());
        return result;
    }

    const FloatAttribute floatAttr(attr);
    if (floatAttr.isValid()) {
        const auto sample = floatAttr.getNearestSample(0.f);
        result.assign(sample.begin(), sample.end());
        return result;
    }

    const DoubleAttribute doubleAttr(attr);
    if (doubleAttr.isValid()) {
        const auto sample = doubleAttr.getNearestSample(0.f);
        result.assign(sample.begin(), sample.end());
    }

    return result;
}

inline std::string
stringValue(const Attribute& attr, const std::string& defValue = std::string{})
{
    return StringAttribute(attr).getValue(defValue, false);
}

inline StringVector
stringValues(const Attribute& attr)
{
    StringVector result;

    const StringAttribute stringAttr(attr);
    if (stringAttr.isValid()) {
        const auto sample = stringAttr.getNearestSample(0.f);
        for (const char* s : sample) {
            result.emplace_back(s);
        }
    }

    return result;
}

inline bool
boolValue(const Attribute& attr, bool defValue = false)
{
    return numericValue<int>(attr, defValue ? 1 : 0) != 0;
}

//-----------------------------------------
// Imath conversions

inline Imath::V2d
asVec2(const Attribute& attr, const Imath::V2d& defValue = Imath::V2d(0.0))
{
    const std::vector<double> values = numericValues<double>(attr);
    if (values.size() < 2) {
        return defValue;
    }

    return Imath::V2d(values[0], values[1]);
}

inline Imath::V3d
asVec3(const Attribute& attr, const Imath::V3d& defValue = Imath::V3d(0.0))
{
    const std::vector<double> values = numericValues<double>(attr);
    if (values.size() < 3) {
        return defValue;
    }

    return Imath::V3d(values[0], values[1], values[2]);
}

inline Imath::V4d
asVec4(const Attribute& attr, const Imath::V4d& defValue = Imath::V4d(0.0))
{
    const std::vector<double> values = numericValues<double>(attr);
    if (values.size() < 4) {
        return defValue;
    }

    return Imath::V4d(values[0], values[1], values[2], values[3]);
}

inline Imath::M44d
asMat44(const Attribute& attr)
{
    const std::vector<double> values = numericValues<double>(attr);
    if (values.size() < 16) {
        return Imath::M44d();
    }

    Imath::M44d result;
    for (int i = 0; i < 16; ++i) {
        result[i / 4][i % 4] = values[i];
    }

    return result;
}

inline DoubleAttribute
fromVec3(const Imath::V3d& v)
{
    return DoubleAttribute(&v.x, 3, 3);
}

inline DoubleAttribute
fromMat44(const Imath::M44d& m)
{
    return DoubleAttribute(m.getValue(), 16, 16);
}

} // namespace metagraph

