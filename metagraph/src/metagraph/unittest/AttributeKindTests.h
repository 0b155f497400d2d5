// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

#include <cppunit/TestFixture.h>
#include <cppunit/extensions/HelperMacros.h>

#include <metagraph/attribute/AttributeKind.h>
#include <metagraph/attribute/AttributeUtils.h>

using namespace metagraph;

#ifndef METAGRAPH_KATANA_ROOT
#error "METAGRAPH_KATANA_ROOT must be defined by the build"
#endif

namespace metagraph {
namespace unittest {

struct TestAttributeKind : public CppUnit::TestFixture
{
    void setUp() override
    {
        const std::string katanaRoot(METAGRAPH_KATANA_ROOT);
        FnAttribute::Bootstrap(katanaRoot + "/ext");
    }

    void testTags()
    {
        CPPUNIT_ASSERT_EQUAL(0, static_cast<int>(AttributeKind::BOOLEAN));
        CPPUNIT_ASSERT_EQUAL(7, static_cast<int>(AttributeKind::BYTE));
        CPPUNIT_ASSERT_EQUAL(14, static_cast<int>(AttributeKind::MATRIX));
        CPPUNIT_ASSERT_EQUAL(22, static_cast<int>(AttributeKind::COMPOUND));
        CPPUNIT_ASSERT_EQUAL(23, static_cast<int>(AttributeKind::INT64));
        CPPUNIT_ASSERT_EQUAL(30, static_cast<int>(AttributeKind::DOUBLE3));
        CPPUNIT_ASSERT_EQUAL(36, static_cast<int>(AttributeKind::MESSAGE));

        for (const AttributeKind kind : allAttributeKinds()) {
            const auto fromTag = kindFromTag(static_cast<int>(kind));
            CPPUNIT_ASSERT(fromTag);
            CPPUNIT_ASSERT(*fromTag == kind);

            const auto fromName = kindFromName(kindName(kind));
            CPPUNIT_ASSERT(fromName);
            CPPUNIT_ASSERT(*fromName == kind);
        }

        // 24 is not assigned
        CPPUNIT_ASSERT(!kindFromTag(24));
        CPPUNIT_ASSERT(!kindFromTag(-1));
        CPPUNIT_ASSERT(!kindFromTag(37));
        CPPUNIT_ASSERT(!kindFromName("quaternion"));
    }

    void testNames()
    {
        CPPUNIT_ASSERT_EQUAL(std::string("bool"), std::string(kindName(AttributeKind::BOOLEAN)));
        CPPUNIT_ASSERT_EQUAL(std::string("double3"), std::string(kindName(AttributeKind::DOUBLE3)));
        CPPUNIT_ASSERT_EQUAL(std::string("message"), std::string(kindName(AttributeKind::MESSAGE)));
        CPPUNIT_ASSERT_EQUAL(std::string("matrixArray"),
                             std::string(kindName(AttributeKind::MATRIX_ARRAY)));
    }

    void testClassification()
    {
        CPPUNIT_ASSERT(isEdgeOnlyKind(AttributeKind::MESSAGE));
        CPPUNIT_ASSERT(!isEdgeOnlyKind(AttributeKind::STRING));
        CPPUNIT_ASSERT(isCompoundKind(AttributeKind::COMPOUND));
        CPPUNIT_ASSERT(isDataArrayKind(AttributeKind::POINT_ARRAY));
        CPPUNIT_ASSERT(isUnitKind(AttributeKind::ANGLE));
        CPPUNIT_ASSERT(!supportsBounds(AttributeKind::STRING));
        CPPUNIT_ASSERT(supportsBounds(AttributeKind::DOUBLE));

        CPPUNIT_ASSERT_EQUAL(int64_t(16), kindTupleSize(AttributeKind::MATRIX));
        CPPUNIT_ASSERT_EQUAL(int64_t(3), kindTupleSize(AttributeKind::POINT_ARRAY));
        CPPUNIT_ASSERT_EQUAL(kAttrTypeDouble, kindStorageType(AttributeKind::INT64));
        CPPUNIT_ASSERT_EQUAL(kAttrTypeInt, kindStorageType(AttributeKind::BOOLEAN));
    }

    void testCoerce()
    {
        std::string error;

        // booleans are normalized
        const Attribute flag = coerceToKind(AttributeKind::BOOLEAN, IntAttribute(5), &error);
        CPPUNIT_ASSERT_EQUAL(1, numericValue<int>(flag));

        // int64 values beyond int range survive as doubles
        const double big = 5000000000.0;
        const Attribute wide = coerceToKind(AttributeKind::INT64, DoubleAttribute(big), &error);
        CPPUNIT_ASSERT_EQUAL(kAttrTypeDouble, wide.getType());
        CPPUNIT_ASSERT_EQUAL(big, numericValue<double>(wide));

        // ints become floats for float kinds
        const Attribute asFloat = coerceToKind(AttributeKind::FLOAT, IntAttribute(2), &error);
        CPPUNIT_ASSERT_EQUAL(kAttrTypeFloat, asFloat.getType());

        const double values[] = { 1.0, 2.0, 3.0 };
        const Attribute vec = coerceToKind(AttributeKind::DOUBLE3, DoubleAttribute(values, 3, 3));
        CPPUNIT_ASSERT(vec.isValid());

        // wrong value count
        error.clear();
        CPPUNIT_ASSERT(!coerceToKind(AttributeKind::DOUBLE3, DoubleAttribute(1.0), &error).isValid());
        CPPUNIT_ASSERT(!error.empty());

        // point arrays need a multiple of three
        CPPUNIT_ASSERT(!coerceToKind(AttributeKind::POINT_ARRAY, DoubleAttribute(values, 2, 1)).isValid());
        CPPUNIT_ASSERT(coerceToKind(AttributeKind::POINT_ARRAY, DoubleAttribute(values, 3, 1)).isValid());

        // integer kinds keep whole values only
        const Attribute whole = coerceToKind(AttributeKind::INT, DoubleAttribute(2.0), &error);
        CPPUNIT_ASSERT_EQUAL(kAttrTypeInt, whole.getType());
        CPPUNIT_ASSERT_EQUAL(2, numericValue<int>(whole));

        error.clear();
        CPPUNIT_ASSERT(!coerceToKind(AttributeKind::INT, DoubleAttribute(2.7), &error).isValid());
        CPPUNIT_ASSERT(!error.empty());
        CPPUNIT_ASSERT(!coerceToKind(AttributeKind::INT64, DoubleAttribute(2.5)).isValid());
        CPPUNIT_ASSERT(!coerceToKind(AttributeKind::ENUM, FloatAttribute(1.5f)).isValid());
        CPPUNIT_ASSERT(coerceToKind(AttributeKind::BOOLEAN, DoubleAttribute(0.5)).isValid());

        // wrong storage
        CPPUNIT_ASSERT(!coerceToKind(AttributeKind::STRING, IntAttribute(1)).isValid());
        CPPUNIT_ASSERT(!coerceToKind(AttributeKind::INT, StringAttribute("1")).isValid());

        // kinds without a direct value
        CPPUNIT_ASSERT(!coerceToKind(AttributeKind::MESSAGE, StringAttribute("a.b")).isValid());
        CPPUNIT_ASSERT(!coerceToKind(AttributeKind::COMPOUND, GroupAttribute()).isValid());
    }

    void testDefaults()
    {
        CPPUNIT_ASSERT(!kindDefaultValue(AttributeKind::MESSAGE).isValid());
        CPPUNIT_ASSERT_EQUAL(0.0, numericValue<double>(kindDefaultValue(AttributeKind::DOUBLE), -1.0));

        const auto identity = numericValues<double>(kindDefaultValue(AttributeKind::MATRIX));
        CPPUNIT_ASSERT_EQUAL(std::size_t(16), identity.size());
        CPPUNIT_ASSERT_EQUAL(1.0, identity[0]);
        CPPUNIT_ASSERT_EQUAL(0.0, identity[1]);
        CPPUNIT_ASSERT_EQUAL(1.0, identity[15]);
    }

    void testImathConversions()
    {
        const double values[] = { 1.0, 2.0, 3.0, 4.0 };
        const DoubleAttribute attr(values, 4, 4);

        CPPUNIT_ASSERT(asVec2(attr) == Imath::V2d(1.0, 2.0));
        CPPUNIT_ASSERT(asVec3(attr) == Imath::V3d(1.0, 2.0, 3.0));
        CPPUNIT_ASSERT(asVec4(attr) == Imath::V4d(1.0, 2.0, 3.0, 4.0));

        // too few values
        CPPUNIT_ASSERT(asVec4(fromVec3(Imath::V3d(1.0)), Imath::V4d(-1.0)) == Imath::V4d(-1.0));

        Imath::M44d m;
        m.setTranslation(Imath::V3d(5.0, 6.0, 7.0));
        CPPUNIT_ASSERT(asMat44(fromMat44(m)) == m);
    }

    CPPUNIT_TEST_SUITE(TestAttributeKind);

    CPPUNIT_TEST( testTags );
    CPPUNIT_TEST( testNames );
    CPPUNIT_TEST( testClassification );
    CPPUNIT_TEST( testCoerce );
    CPPUNIT_TEST( testDefaults );
    CPPUNIT_TEST( testImathConversions );

    CPPUNIT_TEST_SUITE_END();
};

}
}

