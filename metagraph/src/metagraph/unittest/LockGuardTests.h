// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

#include <cppunit/TestFixture.h>
#include <cppunit/extensions/HelperMacros.h>

#include <metagraph/Errors.h>
#include <metagraph/attribute/AttributeUtils.h>
#include <metagraph/node/LockGuard.h>
#include <metagraph/node/NodeUtil.h>
#include <metagraph/plug/PlugUtil.h>
#include <metagraph/scene/Scene.h>

using namespace metagraph;

#ifndef METAGRAPH_KATANA_ROOT
#error "METAGRAPH_KATANA_ROOT must be defined by the build"
#endif

namespace metagraph {
namespace unittest {

struct TestLockGuard : public CppUnit::TestFixture
{
    void setUp() override
    {
        const std::string katanaRoot(METAGRAPH_KATANA_ROOT);
        FnAttribute::Bootstrap(katanaRoot + "/ext");
    }

    void testNodeLockRestored()
    {
        Scene scene;
        const NodeHandle node = node_util::createNode(scene, "rig", NodeTypeRegistry::kNetwork);
        node_util::setLocked(node, true);

        {
            NodeLockGuard guard(node);
            CPPUNIT_ASSERT(guard.wasLocked());
            CPPUNIT_ASSERT(!node.isLocked());
            plug_util::createAttribute(node, "weight", AttributeKind::DOUBLE);
        }

        CPPUNIT_ASSERT(node.isLocked());
        CPPUNIT_ASSERT(node_util::hasAttribute(node, "weight"));

        // an unlocked node stays unlocked
        node_util::setLocked(node, false);
        {
            NodeLockGuard guard(node);
            CPPUNIT_ASSERT(!guard.wasLocked());
        }
        CPPUNIT_ASSERT(!node.isLocked());
    }

    void testNodeLockRestoredOnThrow()
    {
        Scene scene;
        const NodeHandle node = node_util::createNode(scene, "rig", NodeTypeRegistry::kNetwork);
        plug_util::createAttribute(node, "weight", AttributeKind::DOUBLE);
        node_util::setLocked(node, true);

        CPPUNIT_ASSERT_THROW(withUnlockedNode(node, [&]() {
                                 return plug_util::createAttribute(node, "weight",
                                                                   AttributeKind::INT);
                             }),
                             AttributeAlreadyExistsError);

        CPPUNIT_ASSERT(node.isLocked());
    }

    void testDeletedNode()
    {
        Scene scene;
        const NodeHandle node = node_util::createNode(scene, "rig", NodeTypeRegistry::kNetwork);
        node_util::setLocked(node, true);

        // the node is gone when the guard ends, nothing to relock
        CPPUNIT_ASSERT_NO_THROW(withUnlockedNode(node, [&]() { node_util::deleteNode(node); }));
        CPPUNIT_ASSERT(!node.isValid());
    }

    void testPlugLockRestored()
    {
        Scene scene;
        const NodeHandle node = node_util::createNode(scene, "rig", NodeTypeRegistry::kNetwork);
        const Plug settings = plug_util::addCompoundAttribute(
                node, "settings", { makeAttributeSpec("weight", AttributeKind::DOUBLE) });
        const Plug weight = settings.child("weight");
        plug_util::setLockState(settings, true);

        withUnlockedPlug(weight, [&]() {
            plug_util::setValue(weight, DoubleAttribute(0.5));
        });

        CPPUNIT_ASSERT(settings.isLocked());
        CPPUNIT_ASSERT_EQUAL(0.5, numericValue<double>(plug_util::getValue(weight)));

        CPPUNIT_ASSERT_THROW(withUnlockedPlug(weight, [&]() {
                                 plug_util::setValue(weight, StringAttribute("heavy"));
                             }),
                             InvalidValueError);

        CPPUNIT_ASSERT(settings.isLocked());
        CPPUNIT_ASSERT_EQUAL(0.5, numericValue<double>(plug_util::getValue(weight)));
    }

    CPPUNIT_TEST_SUITE(TestLockGuard);

    CPPUNIT_TEST( testNodeLockRestored );
    CPPUNIT_TEST( testNodeLockRestoredOnThrow );
    CPPUNIT_TEST( testDeletedNode );
    CPPUNIT_TEST( testPlugLockRestored );

    CPPUNIT_TEST_SUITE_END();
};

}
}

