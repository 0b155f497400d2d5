// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

#include <cppunit/TestFixture.h>
#include <cppunit/extensions/HelperMacros.h>

#include <metagraph/Errors.h>
#include <metagraph/attribute/AttributeUtils.h>
#include <metagraph/node/NodeUtil.h>
#include <metagraph/plug/PlugUtil.h>
#include <metagraph/scene/Scene.h>

using namespace metagraph;

#ifndef METAGRAPH_KATANA_ROOT
#error "METAGRAPH_KATANA_ROOT must be defined by the build"
#endif

namespace metagraph {
namespace unittest {

struct TestPlugUtil : public CppUnit::TestFixture
{
    void setUp() override
    {
        const std::string katanaRoot(METAGRAPH_KATANA_ROOT);
        FnAttribute::Bootstrap(katanaRoot + "/ext");
    }

    void testScalarValues()
    {
        Scene scene;
        const NodeHandle node = node_util::createNode(scene, "holder", NodeTypeRegistry::kNetwork);

        const Plug weight = plug_util::createAttribute(node, "weight", AttributeKind::DOUBLE);
        CPPUNIT_ASSERT(plug_util::isDefaultValue(weight));

        plug_util::setValue(weight, DoubleAttribute(0.25));
        CPPUNIT_ASSERT_EQUAL(0.25, numericValue<double>(plug_util::getValue(weight)));
        CPPUNIT_ASSERT(!plug_util::isDefaultValue(weight));

        plug_util::resetToDefault(weight);
        CPPUNIT_ASSERT(plug_util::isDefaultValue(weight));

        const Plug label = plug_util::createAttribute(node, "label", AttributeKind::STRING);
        plug_util::setValue(label, StringAttribute("spine"));
        CPPUNIT_ASSERT_EQUAL(std::string("spine"), stringValue(plug_util::getValue(label)));

        // a value the kind cannot hold leaves the plug untouched
        CPPUNIT_ASSERT_THROW(plug_util::setValue(weight, StringAttribute("heavy")),
                             InvalidValueError);
        CPPUNIT_ASSERT(plug_util::isDefaultValue(weight));
    }

    void testMatrixValue()
    {
        Scene scene;
        const NodeHandle node = node_util::createNode(scene, "holder", NodeTypeRegistry::kNetwork);
        const Plug offset = plug_util::createAttribute(node, "offset", AttributeKind::MATRIX);

        Imath::M44d matrix;
        matrix.setTranslation(Imath::V3d(1.0, 2.0, 3.0));
        plug_util::setValue(offset, fromMat44(matrix));

        CPPUNIT_ASSERT(asMat44(plug_util::getValue(offset)) == matrix);

        // matrices need all sixteen values
        CPPUNIT_ASSERT_THROW(plug_util::setValue(offset, DoubleAttribute(1.0)), InvalidValueError);
    }

    void testCompoundValue()
    {
        Scene scene;
        const NodeHandle node = node_util::createNode(scene, "holder", NodeTypeRegistry::kNetwork);

        const Plug settings = plug_util::addCompoundAttribute(
                node, "settings",
                { makeAttributeSpec("enabled", AttributeKind::BOOLEAN),
                  makeAttributeSpec("offset", AttributeKind::DOUBLE3) });

        const double offset[] = { 0.0, 1.0, 0.5 };
        GroupBuilder gb;
        gb.set("enabled", IntAttribute(1));
        gb.set("offset", DoubleAttribute(offset, 3, 3));
        plug_util::setValue(settings, gb.build());

        const GroupAttribute value = plug_util::getValue(settings);
        CPPUNIT_ASSERT(value.isValid());
        CPPUNIT_ASSERT(boolValue(value.getChildByName("enabled")));
        CPPUNIT_ASSERT(asVec3(value.getChildByName("offset")) == Imath::V3d(0.0, 1.0, 0.5));

        CPPUNIT_ASSERT(boolValue(plug_util::getValue(settings.child("enabled"))));

        // unknown children are reported
        GroupBuilder bad;
        bad.set("missing", IntAttribute(1));
        CPPUNIT_ASSERT_THROW(plug_util::setValue(settings, bad.build()), AttributeNotFoundError);
    }

    void testArrayValue()
    {
        Scene scene;
        const NodeHandle node = node_util::createNode(scene, "holder", NodeTypeRegistry::kNetwork);
        const Plug weights = plug_util::createAttribute(node, "weights", AttributeKind::FLOAT, true);

        GroupBuilder gb;
        gb.set(plug_util::elementKey(0), FloatAttribute(0.5f));
        gb.set(plug_util::elementKey(3), FloatAttribute(1.5f));
        plug_util::setValue(weights, gb.build());

        const std::vector<int64_t> expected { 0, 3 };
        CPPUNIT_ASSERT(weights.existingIndices() == expected);

        const GroupAttribute value = plug_util::getValue(weights);
        CPPUNIT_ASSERT_EQUAL(int64_t(2), value.getNumberOfChildren());
        CPPUNIT_ASSERT_EQUAL(1.5f, numericValue<float>(value.getChildByName("i3")));

        int64_t index = -1;
        CPPUNIT_ASSERT(plug_util::parseElementKey("i12", index));
        CPPUNIT_ASSERT_EQUAL(int64_t(12), index);
        CPPUNIT_ASSERT(!plug_util::parseElementKey("12", index));

        // arrays are set from groups only
        CPPUNIT_ASSERT_THROW(plug_util::setValue(weights, FloatAttribute(1.f)), InvalidValueError);

        plug_util::removeElement(weights, 0);
        CPPUNIT_ASSERT_EQUAL(std::size_t(1), weights.existingIndices().size());
    }

    void testMessageValue()
    {
        Scene scene;
        const NodeHandle a = node_util::createNode(scene, "a", NodeTypeRegistry::kNetwork);
        const NodeHandle b = node_util::createNode(scene, "b", NodeTypeRegistry::kNetwork);

        const Plug out = plug_util::createAttribute(a, "out", AttributeKind::MESSAGE);
        const Plug in = plug_util::createAttribute(b, "in", AttributeKind::MESSAGE);

        // message plugs have no value
        CPPUNIT_ASSERT(!plug_util::getValue(out).isValid());

        plug_util::setValue(out, StringAttribute("b.in"));
        CPPUNIT_ASSERT(in.source() == out);

        CPPUNIT_ASSERT_THROW(plug_util::setValue(out, StringAttribute("nowhere.in")),
                             NodeNotFoundError);
    }

    void testBounds()
    {
        Scene scene;
        const NodeHandle node = node_util::createNode(scene, "holder", NodeTypeRegistry::kNetwork);
        const Plug weight = plug_util::createAttribute(node, "weight", AttributeKind::DOUBLE);
        const Plug label = plug_util::createAttribute(node, "label", AttributeKind::STRING);

        CPPUNIT_ASSERT(!plug_util::hasPlugMin(weight));
        CPPUNIT_ASSERT(plug_util::setPlugMin(weight, DoubleAttribute(0.0)));
        CPPUNIT_ASSERT(plug_util::setPlugMax(weight, DoubleAttribute(1.0)));
        CPPUNIT_ASSERT(plug_util::hasPlugMin(weight));
        CPPUNIT_ASSERT_EQUAL(1.0, numericValue<double>(plug_util::plugMax(weight)));

        CPPUNIT_ASSERT(!plug_util::setPlugMin(label, StringAttribute("a")));
        CPPUNIT_ASSERT_THROW(plug_util::plugMin(label), UnsupportedKindOperationError);
    }

    void testNextAvailableElement()
    {
        Scene scene;
        const NodeHandle a = node_util::createNode(scene, "a", NodeTypeRegistry::kNetwork);
        const NodeHandle b = node_util::createNode(scene, "b", NodeTypeRegistry::kNetwork);

        const Plug links = plug_util::createAttribute(a, "links", AttributeKind::MESSAGE, true);
        const Plug in = plug_util::createAttribute(b, "in", AttributeKind::MESSAGE);

        CPPUNIT_ASSERT_EQUAL(int64_t(0), plug_util::nextAvailableElement(links).logicalIndex());

        plug_util::connectPlugs(links.elementByLogicalIndex(0), in);
        CPPUNIT_ASSERT_EQUAL(int64_t(1), plug_util::nextAvailableElement(links).logicalIndex());

        // an existing element without connections is reused
        const Plug numbers = plug_util::createAttribute(a, "numbers", AttributeKind::INT, true);
        GroupBuilder gb;
        gb.set(plug_util::elementKey(4), IntAttribute(1));
        plug_util::setValue(numbers, gb.build());
        CPPUNIT_ASSERT_EQUAL(int64_t(4), plug_util::nextAvailableElement(numbers).logicalIndex());
    }

    void testConnectConflict()
    {
        Scene scene;
        const NodeHandle a = node_util::createNode(scene, "a", NodeTypeRegistry::kNetwork);
        const NodeHandle b = node_util::createNode(scene, "b", NodeTypeRegistry::kNetwork);
        const NodeHandle c = node_util::createNode(scene, "c", NodeTypeRegistry::kNetwork);

        const Plug outA = plug_util::createAttribute(a, "out", AttributeKind::DOUBLE);
        const Plug outC = plug_util::createAttribute(c, "out", AttributeKind::DOUBLE);
        const Plug in = plug_util::createAttribute(b, "in", AttributeKind::DOUBLE);

        plug_util::connectPlugs(outA, in);

        // connecting the same source again changes nothing
        CPPUNIT_ASSERT_NO_THROW(plug_util::connectPlugs(outA, in));

        CPPUNIT_ASSERT_THROW(plug_util::connectPlugs(outC, in), ConnectionConflictError);
        CPPUNIT_ASSERT(in.source() == outA);

        plug_util::connectPlugs(outC, in, true);
        CPPUNIT_ASSERT(in.source() == outC);
        CPPUNIT_ASSERT(!outA.isSource());

        // kinds must match
        const Plug label = plug_util::createAttribute(c, "label", AttributeKind::STRING);
        CPPUNIT_ASSERT_THROW(plug_util::connectPlugs(label, plug_util::createAttribute(
                b, "weight", AttributeKind::DOUBLE)), ConnectionConflictError);

        // destinations are unlocked before they are disconnected
        plug_util::setLockState(in, true);
        plug_util::disconnectPlug(in, true, false);
        CPPUNIT_ASSERT(!in.isDestination());
        CPPUNIT_ASSERT(!in.isLocked());
    }

    void testUnlockPlug()
    {
        Scene scene;
        const NodeHandle node = node_util::createNode(scene, "holder", NodeTypeRegistry::kNetwork);
        const Plug settings = plug_util::addCompoundAttribute(
                node, "settings", { makeAttributeSpec("weight", AttributeKind::DOUBLE) });
        const Plug weight = settings.child("weight");

        CPPUNIT_ASSERT(plug_util::setLockState(settings, true));
        CPPUNIT_ASSERT(!plug_util::setLockState(settings, true));

        // a lock on the compound covers its children
        CPPUNIT_ASSERT(weight.isLocked());
        CPPUNIT_ASSERT_THROW(plug_util::setValue(weight, DoubleAttribute(1.0)), LockedError);

        plug_util::unlockPlug(weight);
        CPPUNIT_ASSERT(!weight.isLocked());
        CPPUNIT_ASSERT(!settings.isLocked());
        CPPUNIT_ASSERT_NO_THROW(plug_util::setValue(weight, DoubleAttribute(1.0)));
    }

    CPPUNIT_TEST_SUITE(TestPlugUtil);

    CPPUNIT_TEST( testScalarValues );
    CPPUNIT_TEST( testMatrixValue );
    CPPUNIT_TEST( testCompoundValue );
    CPPUNIT_TEST( testArrayValue );
    CPPUNIT_TEST( testMessageValue );
    CPPUNIT_TEST( testBounds );
    CPPUNIT_TEST( testNextAvailableElement );
    CPPUNIT_TEST( testConnectConflict );
    CPPUNIT_TEST( testUnlockPlug );

    CPPUNIT_TEST_SUITE_END();
};

}
}

