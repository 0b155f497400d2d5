// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

#include <cppunit/TestFixture.h>
#include <cppunit/extensions/HelperMacros.h>

#include <metagraph/Errors.h>
#include <metagraph/attribute/AttributeUtils.h>
#include <metagraph/node/NodeUtil.h>
#include <metagraph/plug/PlugUtil.h>
#include <metagraph/scene/Modifier.h>
#include <metagraph/scene/Scene.h>
#include <metagraph/scene/TransformUtil.h>

using namespace metagraph;

#ifndef METAGRAPH_KATANA_ROOT
#error "METAGRAPH_KATANA_ROOT must be defined by the build"
#endif

namespace metagraph {
namespace unittest {

struct TestModifier : public CppUnit::TestFixture
{
    void setUp() override
    {
        const std::string katanaRoot(METAGRAPH_KATANA_ROOT);
        FnAttribute::Bootstrap(katanaRoot + "/ext");
    }

    void testBatchUndo()
    {
        Scene scene;

        Modifier modifier(scene);
        const NodeHandle node = modifier.createNode(NodeTypeRegistry::kNetwork, "rig");
        const Plug weight = modifier.addAttribute(node, makeAttributeSpec("weight",
                                                                          AttributeKind::DOUBLE));
        modifier.setPlugValue(weight, DoubleAttribute(2.0));

        // nothing happens before doIt()
        CPPUNIT_ASSERT(!node.isValid());
        CPPUNIT_ASSERT_EQUAL(std::size_t(3), modifier.commandCount());

        modifier.doIt();
        CPPUNIT_ASSERT(node.isValid());
        CPPUNIT_ASSERT_EQUAL(2.0, numericValue<double>(weight.value()));

        modifier.undoIt();
        CPPUNIT_ASSERT(!node.isValid());
        CPPUNIT_ASSERT_EQUAL(std::size_t(0), scene.nodeCount());
    }

    void testFailedBatchIsReverted()
    {
        Scene scene;
        const NodeHandle node = node_util::createNode(scene, "rig", NodeTypeRegistry::kNetwork);

        Modifier modifier(scene);
        const Plug weight = modifier.addAttribute(node, makeAttributeSpec("weight",
                                                                          AttributeKind::DOUBLE));
        modifier.renameNode(node, "renamed");
        // the name is taken by then
        modifier.addAttribute(node, makeAttributeSpec("weight", AttributeKind::INT));

        CPPUNIT_ASSERT_THROW(modifier.doIt(), AttributeAlreadyExistsError);

        CPPUNIT_ASSERT_EQUAL(std::string("rig"), node.name());
        CPPUNIT_ASSERT(!node_util::hasAttribute(node, "weight"));
        CPPUNIT_ASSERT(!weight.isValid());
        CPPUNIT_ASSERT(modifier.isEmpty());
    }

    void testUndoDelete()
    {
        Scene scene;
        const NodeHandle a = node_util::createNode(scene, "a", NodeTypeRegistry::kNetwork);
        const NodeHandle b = node_util::createNode(scene, "b", NodeTypeRegistry::kNetwork);
        const Plug out = plug_util::createAttribute(a, "out", AttributeKind::MESSAGE);
        const Plug in = plug_util::createAttribute(b, "in", AttributeKind::MESSAGE);
        plug_util::connectPlugs(out, in);

        Modifier modifier(scene);
        modifier.deleteNode(a);
        modifier.doIt();

        CPPUNIT_ASSERT(!a.isValid());
        CPPUNIT_ASSERT(a.isBound());
        CPPUNIT_ASSERT(!in.isDestination());
        CPPUNIT_ASSERT_THROW(a.name(), StaleReferenceError);

        modifier.undoIt();
        CPPUNIT_ASSERT(a.isValid());
        CPPUNIT_ASSERT_EQUAL(std::string("a"), a.name());
        CPPUNIT_ASSERT(in.source() == out);
    }

    void testLockedNode()
    {
        Scene scene;
        const NodeHandle node = node_util::createNode(scene, "rig", NodeTypeRegistry::kNetwork);
        const Plug weight = plug_util::createAttribute(node, "weight", AttributeKind::DOUBLE);

        node_util::setLocked(node, true);
        CPPUNIT_ASSERT(node.isLocked());

        CPPUNIT_ASSERT_THROW(node_util::rename(node, "other"), LockedError);
        CPPUNIT_ASSERT_THROW(plug_util::createAttribute(node, "extra", AttributeKind::INT),
                             LockedError);

        Modifier removal(scene);
        removal.removeAttribute(weight);
        CPPUNIT_ASSERT_THROW(removal.doIt(), LockedError);

        // deleteNode clears the lock itself
        node_util::deleteNode(node);
        CPPUNIT_ASSERT(!node.isValid());
    }

    void testUniqueNames()
    {
        Scene scene;
        const NodeHandle first = node_util::createNode(scene, "joint1", NodeTypeRegistry::kJoint);
        const NodeHandle second = node_util::createNode(scene, "joint1", NodeTypeRegistry::kJoint);

        CPPUNIT_ASSERT_EQUAL(std::string("joint1"), first.name());
        CPPUNIT_ASSERT(second.name() != first.name());
        CPPUNIT_ASSERT(scene.findNode(second.name()) == second);

        CPPUNIT_ASSERT_THROW(node_util::createNode(scene, "x", "noSuchType"), MetaGraphError);
    }

    void testDagHierarchy()
    {
        Scene scene;
        const NodeHandle root = node_util::createNode(scene, "root", NodeTypeRegistry::kTransform);
        const NodeHandle joint = node_util::createNode(scene, "hip", NodeTypeRegistry::kJoint, root);

        CPPUNIT_ASSERT(joint.isDag());
        CPPUNIT_ASSERT(joint.parent() == root);
        CPPUNIT_ASSERT_EQUAL(std::string("|root|hip"), joint.fullPathName());
        CPPUNIT_ASSERT(node_util::hasAttribute(joint, "jointOrient"));
        CPPUNIT_ASSERT(asVec3(Plug(joint, "scale").value()) == Imath::V3d(1.0, 1.0, 1.0));

        // networks have no transform
        const NodeHandle network = node_util::createNode(scene, "net", NodeTypeRegistry::kNetwork);
        CPPUNIT_ASSERT(!network.isDag());
        CPPUNIT_ASSERT(!node_util::hasAttribute(network, "translate"));

        // deleting a parent takes its children along
        node_util::deleteNode(root);
        CPPUNIT_ASSERT(!joint.isValid());
    }

    void testReparentMaintainOffset()
    {
        Scene scene;
        const NodeHandle parent = node_util::createNode(scene, "parent", NodeTypeRegistry::kTransform);
        const NodeHandle child = node_util::createNode(scene, "child", NodeTypeRegistry::kTransform);

        plug_util::setValue(Plug(parent, "translate"), fromVec3(Imath::V3d(10.0, 0.0, 0.0)));
        plug_util::setValue(Plug(child, "translate"), fromVec3(Imath::V3d(12.0, 1.0, 0.0)));

        node_util::reparent(child, parent, true);

        CPPUNIT_ASSERT(child.parent() == parent);
        const Imath::V3d local = asVec3(Plug(child, "translate").value());
        CPPUNIT_ASSERT(local.equalWithAbsError(Imath::V3d(2.0, 1.0, 0.0), 1e-9));

        const Imath::V3d world = transform::worldMatrix(child).translation();
        CPPUNIT_ASSERT(world.equalWithAbsError(Imath::V3d(12.0, 1.0, 0.0), 1e-9));

        // without the offset the local values are kept
        node_util::reparent(child, NodeHandle(), false);
        CPPUNIT_ASSERT(!child.parent().isBound());
        CPPUNIT_ASSERT(asVec3(Plug(child, "translate").value())
                .equalWithAbsError(Imath::V3d(2.0, 1.0, 0.0), 1e-9));

        CPPUNIT_ASSERT_THROW(node_util::reparent(child, child, false), MetaGraphError);
    }

    CPPUNIT_TEST_SUITE(TestModifier);

    CPPUNIT_TEST( testBatchUndo );
    CPPUNIT_TEST( testFailedBatchIsReverted );
    CPPUNIT_TEST( testUndoDelete );
    CPPUNIT_TEST( testLockedNode );
    CPPUNIT_TEST( testUniqueNames );
    CPPUNIT_TEST( testDagHierarchy );
    CPPUNIT_TEST( testReparentMaintainOffset );

    CPPUNIT_TEST_SUITE_END();
};

}
}

