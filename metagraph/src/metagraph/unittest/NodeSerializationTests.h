// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

#include <cppunit/TestFixture.h>
#include <cppunit/extensions/HelperMacros.h>

#include <metagraph/Errors.h>
#include <metagraph/attribute/AttributeUtils.h>
#include <metagraph/meta/MetaNode.h>
#include <metagraph/meta/MetaRegistry.h>
#include <metagraph/node/NodeSerialization.h>
#include <metagraph/node/NodeUtil.h>
#include <metagraph/plug/PlugSerialization.h>
#include <metagraph/plug/PlugUtil.h>
#include <metagraph/scene/Scene.h>

using namespace metagraph;

#ifndef METAGRAPH_KATANA_ROOT
#error "METAGRAPH_KATANA_ROOT must be defined by the build"
#endif

namespace metagraph {
namespace unittest {

struct TestNodeSerialization : public CppUnit::TestFixture
{
    void setUp() override
    {
        const std::string katanaRoot(METAGRAPH_KATANA_ROOT);
        FnAttribute::Bootstrap(katanaRoot + "/ext");
    }

    static GroupAttribute makeRecord(const std::string& name,
                                     const std::string& typeName,
                                     const std::string& requirement = std::string{},
                                     const std::string& parent = std::string{})
    {
        GroupBuilder gb;
        gb.set("name", StringAttribute(name));
        gb.set("type", StringAttribute(typeName));
        if (!requirement.empty()) {
            gb.set("requirements", StringAttribute(requirement));
        }
        if (!parent.empty()) {
            gb.set("parent", StringAttribute(parent));
        }
        return gb.build();
    }

    static void registerRigTypes(Scene& scene)
    {
        scene.registerExtension("rigTypes", [](NodeTypeRegistry& types) {
            NodeType control;
            control.name = "rigControl";
            control.isDag = true;
            control.attributes.push_back(makeAttributeSpec("size", AttributeKind::DOUBLE));
            control.requirement = "rigTypes";
            return types.registerType(control);
        });
    }

    void testRoundTrip()
    {
        Scene source;
        const NodeHandle root = node_util::createNode(source, "root", NodeTypeRegistry::kTransform);
        const NodeHandle hip = node_util::createNode(source, "hip", NodeTypeRegistry::kJoint, root);
        const NodeHandle holder = node_util::createNode(source, "holder", NodeTypeRegistry::kNetwork);

        plug_util::setValue(Plug(hip, "translate"), fromVec3(Imath::V3d(0.0, 9.0, 0.0)));

        const Plug weight = plug_util::createAttribute(holder, "weight", AttributeKind::DOUBLE);
        plug_util::setValue(weight, DoubleAttribute(0.5));
        plug_util::setPlugMax(weight, DoubleAttribute(1.0));
        plug_util::setLockState(weight, true);

        const Plug link = plug_util::createAttribute(holder, "link", AttributeKind::MESSAGE);
        const Plug target = plug_util::createAttribute(hip, "target", AttributeKind::MESSAGE);
        plug_util::connectPlugs(link, target);
        node_util::setLocked(holder, true);

        const GroupAttribute records = node_util::serializeNodes(source.nodes());
        CPPUNIT_ASSERT_EQUAL(int64_t(3), records.getNumberOfChildren());

        Scene copy;
        const std::vector<NodeHandle> created = node_util::deserializeNodes(copy, records);
        CPPUNIT_ASSERT_EQUAL(std::size_t(3), created.size());
        CPPUNIT_ASSERT_EQUAL(std::size_t(3), copy.nodeCount());

        const NodeHandle copiedRoot = copy.findNode("root");
        const NodeHandle copiedHip = copy.findNode("hip");
        const NodeHandle copiedHolder = copy.findNode("holder");
        CPPUNIT_ASSERT(copiedHip.parent() == copiedRoot);
        CPPUNIT_ASSERT(asVec3(Plug(copiedHip, "translate").value()) == Imath::V3d(0.0, 9.0, 0.0));

        const Plug copiedWeight(copiedHolder, "weight");
        CPPUNIT_ASSERT_EQUAL(0.5, numericValue<double>(copiedWeight.value()));
        CPPUNIT_ASSERT_EQUAL(1.0, numericValue<double>(plug_util::plugMax(copiedWeight)));
        CPPUNIT_ASSERT(copiedWeight.isLocked());
        CPPUNIT_ASSERT(copiedHolder.isLocked());

        CPPUNIT_ASSERT(Plug(copiedHip, "target").source() == Plug(copiedHolder, "link"));

        // records are stable across a round trip
        CPPUNIT_ASSERT(node_util::serializeNode(copiedHolder) == node_util::serializeNode(holder));
    }

    struct PlugCase
    {
        AttributeSpec::Ptr spec;
        Attribute value;
    };

    void testPlugRecordRoundTrip()
    {
        Scene scene;
        const NodeHandle holder = node_util::createNode(scene, "holder", NodeTypeRegistry::kNetwork);
        const NodeHandle peer = node_util::createNode(scene, "peer", NodeTypeRegistry::kNetwork);
        const Plug peerIn = plug_util::createAttribute(peer, "in", AttributeKind::MESSAGE);

        AttributeSpec::Ptr weightSpec = makeAttributeSpec("weight", AttributeKind::DOUBLE);
        weightSpec->defaultValue = DoubleAttribute(0.5);
        weightSpec->minValue = DoubleAttribute(0.0);
        weightSpec->maxValue = DoubleAttribute(1.0);

        Imath::M44d pivot;
        pivot.setTranslation(Imath::V3d(1.0, 2.0, 3.0));
        const double offset[] = { 0.5, 1.0, 2.0 };
        const int numbers[] = { 1, 2, 3, 4, 5 };

        const std::vector<PlugCase> cases {
            { makeAttributeSpec("enabled", AttributeKind::BOOLEAN), IntAttribute(1) },
            { makeAttributeSpec("count", AttributeKind::INT), IntAttribute(7) },
            { weightSpec, DoubleAttribute(0.25) },
            { makeAttributeSpec("offset", AttributeKind::DOUBLE3), DoubleAttribute(offset, 3, 3) },
            { makeAttributeSpec("label", AttributeKind::STRING), StringAttribute("spine") },
            { makeAttributeSpec("pivot", AttributeKind::MATRIX), fromMat44(pivot) },
            { makeEnumSpec("side", { { "left", 0 }, { "center", 5 }, { "right", 10 } }),
              IntAttribute(10) },
            { makeAttributeSpec("numbers", AttributeKind::INT_ARRAY), IntAttribute(numbers, 5, 1) },
            { makeAttributeSpec("link", AttributeKind::MESSAGE), StringAttribute("peer.in") },
        };

        for (const PlugCase& entry : cases) {
            const std::string name = entry.spec->name;
            const Plug plug = plug_util::addAttribute(holder, entry.spec);
            plug_util::setValue(plug, entry.value);
            plug_util::setLockState(plug, true);

            const Attribute before = plug_util::getValue(plug);
            const GroupAttribute record = plug_util::serializePlug(plug);
            CPPUNIT_ASSERT_MESSAGE(name, record.isValid());

            Modifier removal(scene);
            plug_util::unlockPlug(plug, &removal);
            removal.removeAttribute(plug);
            removal.doIt();
            CPPUNIT_ASSERT_MESSAGE(name, !node_util::hasAttribute(holder, name));

            const Plug restored = plug_util::deserializePlug(holder, record);
            CPPUNIT_ASSERT_MESSAGE(name, restored.kind() == entry.spec->kind);
            CPPUNIT_ASSERT_MESSAGE(name, restored.isDynamic());
            CPPUNIT_ASSERT_MESSAGE(name, restored.isLocked());

            if (entry.spec->kind == AttributeKind::MESSAGE) {
                CPPUNIT_ASSERT_MESSAGE(name, !plug_util::getValue(restored).isValid());
            } else {
                CPPUNIT_ASSERT_MESSAGE(name, plug_util::getValue(restored) == before);
            }
        }

        const Plug weight(holder, "weight");
        CPPUNIT_ASSERT_EQUAL(0.5, numericValue<double>(plug_util::plugDefault(weight)));
        CPPUNIT_ASSERT_EQUAL(0.0, numericValue<double>(plug_util::plugMin(weight)));
        CPPUNIT_ASSERT_EQUAL(1.0, numericValue<double>(plug_util::plugMax(weight)));

        const Plug side(holder, "side");
        const StringVector expectedNames { "left", "center", "right" };
        const IntVector expectedIndices { 0, 5, 10 };
        CPPUNIT_ASSERT(plug_util::enumNames(side) == expectedNames);
        CPPUNIT_ASSERT(plug_util::enumIndices(side) == expectedIndices);
        CPPUNIT_ASSERT_EQUAL(10, numericValue<int>(plug_util::getValue(side)));

        const std::vector<int> restoredNumbers =
                numericValues<int>(plug_util::getValue(Plug(holder, "numbers")));
        CPPUNIT_ASSERT_EQUAL(std::size_t(5), restoredNumbers.size());
        CPPUNIT_ASSERT_EQUAL(5, restoredNumbers.back());

        CPPUNIT_ASSERT(asMat44(plug_util::getValue(Plug(holder, "pivot"))) == pivot);

        // the edge itself travels with the destination's node record
        const Plug link(holder, "link");
        CPPUNIT_ASSERT(peerIn.source().isNull());
        plug_util::setValue(link, StringAttribute("peer.in"));
        CPPUNIT_ASSERT(peerIn.source() == link);

        const GroupAttribute peerRecord = node_util::serializeNode(peer);
        node_util::deleteNode(peer);
        CPPUNIT_ASSERT(!link.isSource());

        const NodeHandle restoredPeer = node_util::deserializeNode(scene, peerRecord);
        CPPUNIT_ASSERT(Plug(restoredPeer, "in").source() == link);
        CPPUNIT_ASSERT(link.isLocked());
    }

    void testChildBeforeParent()
    {
        GroupBuilder gb;
        gb.set("0", makeRecord("hand", NodeTypeRegistry::kJoint, std::string{}, "|arm"));
        gb.set("1", makeRecord("arm", NodeTypeRegistry::kJoint));

        Scene scene;
        const std::vector<NodeHandle> created = node_util::deserializeNodes(scene, gb.build());
        CPPUNIT_ASSERT_EQUAL(std::size_t(2), created.size());
        CPPUNIT_ASSERT_EQUAL(std::string("|arm|hand"), scene.findNode("hand").fullPathName());
    }

    void testMissingRequirement()
    {
        GroupBuilder gb;
        gb.set("0", makeRecord("ctrl", "rigControl", "rigTypes"));
        gb.set("1", makeRecord("holder", NodeTypeRegistry::kNetwork));

        // the failing record is skipped, the others still load
        Scene scene;
        const std::vector<NodeHandle> created = node_util::deserializeNodes(scene, gb.build());
        CPPUNIT_ASSERT_EQUAL(std::size_t(2), created.size());
        CPPUNIT_ASSERT(!created[0].isValid());
        CPPUNIT_ASSERT(created[1].isValid());
        CPPUNIT_ASSERT_EQUAL(std::size_t(1), scene.nodeCount());

        CPPUNIT_ASSERT_THROW(node_util::deserializeNode(scene, makeRecord("ctrl", "rigControl",
                                                                          "rigTypes")),
                             MissingRequirementError);

        registerRigTypes(scene);
        const NodeHandle ctrl = node_util::deserializeNode(scene, makeRecord("ctrl", "rigControl",
                                                                             "rigTypes"));
        CPPUNIT_ASSERT(ctrl.isValid());
        CPPUNIT_ASSERT(scene.isExtensionLoaded("rigTypes"));
        CPPUNIT_ASSERT(node_util::hasAttribute(ctrl, "size"));

        // nodes of extension types record what they need
        const GroupAttribute record = node_util::serializeNode(ctrl);
        CPPUNIT_ASSERT_EQUAL(std::string("rigTypes"),
                             stringValue(record.getChildByName("requirements")));
    }

    void testMetaNodeRecord()
    {
        MetaRegistry registry;
        Scene source;
        const MetaNode::Ptr metaNode = registry.create(MetaNode::kTypeName, source, "character");
        metaNode->addAttribute("side", StringAttribute("left"), AttributeKind::STRING);

        Scene copy;
        const NodeHandle node = node_util::deserializeNode(copy, metaNode->serialize());

        const MetaNode::Ptr restored = registry.construct(node, std::string{}, false);
        CPPUNIT_ASSERT(restored->state() == MetaNode::State::BOUND_INITIALIZED);
        CPPUNIT_ASSERT_EQUAL(std::string(MetaNode::kTypeName), restored->classType());
        CPPUNIT_ASSERT_EQUAL(std::string("left"), stringValue(restored->getAttribute("side")));
        CPPUNIT_ASSERT(restored->attribute(MetaNode::kClassAttr).isLocked());
        CPPUNIT_ASSERT(restored->isLocked());
    }

    void testAttributeSpecRecord()
    {
        const AttributeSpec::Ptr spec = makeEnumSpec(
                "side", enumFieldsFromNames({ "left", "right", "center" }), 2);

        const AttributeSpec::Ptr restored =
                plug_util::deserializeAttributeSpec(plug_util::serializeAttributeSpec(*spec));
        CPPUNIT_ASSERT(restored);
        CPPUNIT_ASSERT(restored->kind == AttributeKind::ENUM);
        CPPUNIT_ASSERT(restored->enumFields == spec->enumFields);
        CPPUNIT_ASSERT_EQUAL(2, numericValue<int>(restored->defaultValue));

        GroupBuilder gb;
        gb.set("name", StringAttribute("broken"));
        gb.set("kind", StringAttribute("quaternion"));
        CPPUNIT_ASSERT(!plug_util::deserializeAttributeSpec(gb.build()));
    }

    void testConnectWithoutForce()
    {
        Scene scene;
        const NodeHandle a = node_util::createNode(scene, "a", NodeTypeRegistry::kNetwork);
        const NodeHandle b = node_util::createNode(scene, "b", NodeTypeRegistry::kNetwork);
        const NodeHandle c = node_util::createNode(scene, "c", NodeTypeRegistry::kNetwork);

        const Plug in = plug_util::createAttribute(c, "in", AttributeKind::MESSAGE);
        node_util::connect(plug_util::createAttribute(a, "out", AttributeKind::MESSAGE), in);

        CPPUNIT_ASSERT_THROW(node_util::connect(plug_util::createAttribute(
                b, "out", AttributeKind::MESSAGE), in), ConnectionConflictError);
        CPPUNIT_ASSERT(in.source().node() == a);
    }

    CPPUNIT_TEST_SUITE(TestNodeSerialization);

    CPPUNIT_TEST( testRoundTrip );
    CPPUNIT_TEST( testPlugRecordRoundTrip );
    CPPUNIT_TEST( testChildBeforeParent );
    CPPUNIT_TEST( testMissingRequirement );
    CPPUNIT_TEST( testMetaNodeRecord );
    CPPUNIT_TEST( testAttributeSpecRecord );
    CPPUNIT_TEST( testConnectWithoutForce );

    CPPUNIT_TEST_SUITE_END();
};

}
}

