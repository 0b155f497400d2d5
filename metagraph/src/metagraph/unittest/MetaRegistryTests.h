// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

#include <cppunit/TestFixture.h>
#include <cppunit/extensions/HelperMacros.h>

#include <metagraph/Errors.h>
#include <metagraph/meta/MetaNode.h>
#include <metagraph/meta/MetaRegistry.h>
#include <metagraph/meta/MetaUtil.h>
#include <metagraph/node/NodeUtil.h>
#include <metagraph/scene/Scene.h>

#include <MetaTypes/MetaRig/MetaRig.h>

using namespace metagraph;

#ifndef METAGRAPH_KATANA_ROOT
#error "METAGRAPH_KATANA_ROOT must be defined by the build"
#endif

#ifndef METAGRAPH_TYPE_PLUGIN_DIR
#error "METAGRAPH_TYPE_PLUGIN_DIR must be defined by the build"
#endif

namespace metagraph {
namespace unittest {

struct TestMetaRegistry : public CppUnit::TestFixture
{
    void setUp() override
    {
        const std::string katanaRoot(METAGRAPH_KATANA_ROOT);
        FnAttribute::Bootstrap(katanaRoot + "/ext");
    }

    void testRegisterType()
    {
        MetaRegistry registry;
        CPPUNIT_ASSERT(registry.isRegistered(MetaNode::kTypeName));
        CPPUNIT_ASSERT(!registry.isRegistered(MetaRig::kTypeName));

        CPPUNIT_ASSERT(registry.registerType<MetaRig>());
        CPPUNIT_ASSERT(!registry.registerType<MetaRig>());
        CPPUNIT_ASSERT(!registry.registerType(MetaRig::kTypeName, MetaRegistry::Creator()));
        CPPUNIT_ASSERT(!registry.registerType("", [](const MetaRegistry& r) {
            return std::make_shared<MetaNode>(r);
        }));

        const std::vector<std::string> expected { MetaNode::kTypeName, MetaRig::kTypeName };
        CPPUNIT_ASSERT(registry.typeNames() == expected);
    }

    void testFromTag()
    {
        MetaRegistry registry;
        registry.registerType<MetaRig>();

        CPPUNIT_ASSERT(!registry.fromTag("Unknown"));

        const MetaNode::Ptr rig = registry.fromTag(MetaRig::kTypeName);
        CPPUNIT_ASSERT(rig);
        CPPUNIT_ASSERT_EQUAL(std::string(MetaRig::kTypeName), rig->typeName());
        CPPUNIT_ASSERT(rig->state() == MetaNode::State::UNBOUND);
        CPPUNIT_ASSERT(&rig->registry() == &registry);
    }

    void testCreateIsOneUnit()
    {
        MetaRegistry registry;
        Scene scene;

        CPPUNIT_ASSERT_THROW(registry.create("Unknown", scene, "x"), MetaGraphError);
        CPPUNIT_ASSERT_EQUAL(std::size_t(0), scene.nodeCount());

        const MetaNode::Ptr first = registry.create(MetaNode::kTypeName, scene, "rig");
        const MetaNode::Ptr second = registry.create(MetaNode::kTypeName, scene, "rig");
        CPPUNIT_ASSERT(first->name() != second->name());
        CPPUNIT_ASSERT_EQUAL(std::size_t(2), scene.nodeCount());
    }

    void testConstructStaleNode()
    {
        MetaRegistry registry;
        Scene scene;
        const NodeHandle node = node_util::createNode(scene, "plain", NodeTypeRegistry::kNetwork);
        node_util::deleteNode(node);

        CPPUNIT_ASSERT_THROW(registry.construct(node), StaleReferenceError);
    }

    void testScan()
    {
        MetaRegistry registry;

        CPPUNIT_ASSERT_EQUAL(std::size_t(0), registry.scan({ "/no/such/directory" }));
        CPPUNIT_ASSERT(!registry.isRegistered(MetaRig::kTypeName));

        const std::string pluginDir(METAGRAPH_TYPE_PLUGIN_DIR);
        CPPUNIT_ASSERT_EQUAL(std::size_t(1), registry.scanSearchPath("/no/such/directory:"
                                                                     + pluginDir));
        CPPUNIT_ASSERT(registry.isRegistered(MetaRig::kTypeName));
        CPPUNIT_ASSERT(registry.isRegistered(MetaSubSystem::kTypeName));

        // libraries are loaded once
        CPPUNIT_ASSERT_EQUAL(std::size_t(0), registry.scan({ pluginDir }));
    }

    void testSceneQueries()
    {
        MetaRegistry registry;
        registry.registerType<MetaRig>();
        registry.registerType<MetaSubSystem>();

        Scene scene;
        const auto rig = registry.create<MetaRig>(scene, "body");
        const auto arm = rig->addSubSystem("arm");
        const auto leg = rig->addSubSystem("leg");
        const NodeHandle ctrl = node_util::createNode(scene, "ctrl", NodeTypeRegistry::kTransform);
        node_util::createNode(scene, "plain", NodeTypeRegistry::kNetwork);
        arm->addControl(ctrl, "hand");

        CPPUNIT_ASSERT_EQUAL(std::size_t(3), meta_util::iterSceneMetaNodes(registry, scene).size());
        CPPUNIT_ASSERT(!meta_util::isMetaNode(registry, ctrl));
        CPPUNIT_ASSERT(meta_util::isMetaNode(registry, arm->node()));

        const std::vector<MetaNode::Ptr> roots = meta_util::findSceneRoots(registry, scene);
        CPPUNIT_ASSERT_EQUAL(std::size_t(1), roots.size());
        CPPUNIT_ASSERT(*roots.front() == *rig);

        CPPUNIT_ASSERT_EQUAL(std::size_t(2), meta_util::findMetaNodesByClassType(
                registry, scene, MetaSubSystem::kTypeName).size());

        CPPUNIT_ASSERT(meta_util::isConnectedToMeta(registry, ctrl));
        const auto upstream = meta_util::upstreamMetaNode(registry, ctrl);
        CPPUNIT_ASSERT(*upstream.second == *arm);
        CPPUNIT_ASSERT_EQUAL(std::string(MetaNode::kTargetAttr), upstream.first.partialName());

        const std::vector<MetaNode::Ptr> feeding =
                meta_util::connectedMetaNodes(registry, ctrl, TraversalDirection::UPSTREAM);
        CPPUNIT_ASSERT_EQUAL(std::size_t(1), feeding.size());

        const std::vector<Plug> legs = meta_util::filterSceneByAttributeValues(
                registry, scene, { MetaRig::kRigNameAttr }, "^le");
        CPPUNIT_ASSERT_EQUAL(std::size_t(1), legs.size());
        CPPUNIT_ASSERT(legs.front().node() == leg->node());

        const std::vector<Plug> exact = meta_util::filterSceneByAttributeValues(
                registry, scene, { MetaRig::kRigNameAttr, "missing" }, StringAttribute("arm"));
        CPPUNIT_ASSERT_EQUAL(std::size_t(1), exact.size());
    }

    CPPUNIT_TEST_SUITE(TestMetaRegistry);

    CPPUNIT_TEST( testRegisterType );
    CPPUNIT_TEST( testFromTag );
    CPPUNIT_TEST( testCreateIsOneUnit );
    CPPUNIT_TEST( testConstructStaleNode );
    CPPUNIT_TEST( testScan );
    CPPUNIT_TEST( testSceneQueries );

    CPPUNIT_TEST_SUITE_END();
};

}
}

