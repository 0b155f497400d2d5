// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

#include <cppunit/TestFixture.h>
#include <cppunit/extensions/HelperMacros.h>

#include <metagraph/meta/MetaNode.h>
#include <metagraph/meta/MetaRegistry.h>
#include <metagraph/meta/MetaTraversal.h>
#include <metagraph/node/NodeUtil.h>
#include <metagraph/scene/Scene.h>

using namespace metagraph;

#ifndef METAGRAPH_KATANA_ROOT
#error "METAGRAPH_KATANA_ROOT must be defined by the build"
#endif

namespace metagraph {
namespace unittest {

struct TestMetaTraversal : public CppUnit::TestFixture
{
    void setUp() override
    {
        const std::string katanaRoot(METAGRAPH_KATANA_ROOT);
        FnAttribute::Bootstrap(katanaRoot + "/ext");
    }

    static std::vector<MetaNode::Ptr> makeChain(const MetaRegistry& registry,
                                                Scene& scene,
                                                std::size_t length)
    {
        std::vector<MetaNode::Ptr> chain;
        for (std::size_t i = 0; i < length; ++i) {
            chain.push_back(registry.create(MetaNode::kTypeName, scene,
                                            "link" + std::to_string(i)));
            if (i > 0) {
                chain[i - 1]->addChild(*chain[i]);
            }
        }
        return chain;
    }

    void testDepthLimit()
    {
        MetaRegistry registry;
        Scene scene;
        const std::vector<MetaNode::Ptr> chain = makeChain(registry, scene, 100);
        const MetaNode::Ptr& head = chain.front();

        CPPUNIT_ASSERT_EQUAL(std::size_t(1), head->children(1).count());
        CPPUNIT_ASSERT_EQUAL(std::size_t(50), head->children(50).count());
        CPPUNIT_ASSERT_EQUAL(std::size_t(99), head->children(101).count());
        CPPUNIT_ASSERT_EQUAL(std::size_t(0), head->children(0).count());
        CPPUNIT_ASSERT_EQUAL(std::size_t(0), head->children(-3).count());

        CPPUNIT_ASSERT_EQUAL(std::size_t(99), chain.back()->parents().count());
        CPPUNIT_ASSERT_EQUAL(std::size_t(0), chain.back()->children().count());
    }

    void testOrder()
    {
        MetaRegistry registry;
        Scene scene;
        const std::vector<MetaNode::Ptr> chain = makeChain(registry, scene, 4);

        const std::vector<MetaNode::Ptr> below = chain[0]->children().toVector();
        CPPUNIT_ASSERT_EQUAL(std::size_t(3), below.size());
        for (std::size_t i = 0; i < below.size(); ++i) {
            CPPUNIT_ASSERT(*below[i] == *chain[i + 1]);
        }

        const std::vector<MetaNode::Ptr> above = chain[3]->parents(2).toVector();
        CPPUNIT_ASSERT_EQUAL(std::size_t(2), above.size());
        CPPUNIT_ASSERT(*above[0] == *chain[2]);
        CPPUNIT_ASSERT(*above[1] == *chain[1]);
    }

    void testLazyRestart()
    {
        MetaRegistry registry;
        Scene scene;
        const std::vector<MetaNode::Ptr> chain = makeChain(registry, scene, 3);

        const MetaTraversal walk = chain[0]->children();
        CPPUNIT_ASSERT_EQUAL(std::size_t(2), walk.count());

        // a new walk sees the graph as it is when it starts
        const MetaNode::Ptr extra = registry.create(MetaNode::kTypeName, scene, "extra");
        chain[2]->addChild(*extra);
        CPPUNIT_ASSERT_EQUAL(std::size_t(3), walk.count());

        std::size_t seen = 0;
        for (auto it = walk.begin(); it != walk.end(); ++it) {
            CPPUNIT_ASSERT(*it);
            ++seen;
        }
        CPPUNIT_ASSERT_EQUAL(std::size_t(3), seen);
    }

    void testSharedDescendant()
    {
        MetaRegistry::Options options;
        options.parentCardinality = ParentCardinality::MULTIPLE;
        MetaRegistry registry(options);
        Scene scene;

        const MetaNode::Ptr top = registry.create(MetaNode::kTypeName, scene, "top");
        const MetaNode::Ptr left = registry.create(MetaNode::kTypeName, scene, "left");
        const MetaNode::Ptr right = registry.create(MetaNode::kTypeName, scene, "right");
        const MetaNode::Ptr bottom = registry.create(MetaNode::kTypeName, scene, "bottom");

        top->addChild(*left);
        top->addChild(*right);
        left->addChild(*bottom);
        right->addChild(*bottom);

        // reached along both paths
        std::size_t bottoms = 0;
        for (const MetaNode::Ptr& node : top->children()) {
            if (*node == *bottom) {
                ++bottoms;
            }
        }
        CPPUNIT_ASSERT_EQUAL(std::size_t(2), bottoms);
        CPPUNIT_ASSERT_EQUAL(std::size_t(4), top->children().count());
    }

    void testMetaTree()
    {
        MetaRegistry registry;
        Scene scene;
        const std::vector<MetaNode::Ptr> chain = makeChain(registry, scene, 3);
        const NodeHandle ctrl = node_util::createNode(scene, "ctrl", NodeTypeRegistry::kTransform);
        chain[1]->connectTo("CTRL_main", ctrl);

        // incoming connections by default
        CPPUNIT_ASSERT_EQUAL(std::size_t(2), chain[2]->tree().count());
        CPPUNIT_ASSERT_EQUAL(std::size_t(1), chain[2]->tree(1).count());
        CPPUNIT_ASSERT_EQUAL(std::size_t(0), chain[0]->tree().count());

        // plain nodes are passed over
        CPPUNIT_ASSERT_EQUAL(std::size_t(2),
                             chain[0]->tree(MetaNode::kDefaultDepthLimit,
                                            TraversalDirection::DOWNSTREAM).count());

        const MetaTraversal fromPlug = MetaTraversal::namedAttribute(
                registry, chain[0]->attribute(MetaNode::kChildrenAttr),
                TraversalDirection::DOWNSTREAM, 1);
        CPPUNIT_ASSERT(fromPlug.params().mode == MetaTraversal::Mode::NAMED_ATTRIBUTE);
        CPPUNIT_ASSERT_EQUAL(std::size_t(1), fromPlug.count());
    }

    void testFilters()
    {
        MetaRegistry registry;
        Scene scene;
        const std::vector<MetaNode::Ptr> chain = makeChain(registry, scene, 4);
        chain[2]->addAttribute("side", StringAttribute("left"), AttributeKind::STRING);

        CPPUNIT_ASSERT_EQUAL(std::size_t(3), chain[0]->findChildrenByClassType(
                MetaNode::kTypeName).size());
        CPPUNIT_ASSERT_EQUAL(std::size_t(1), chain[0]->findChildrenByClassType(
                MetaNode::kTypeName, 1).size());
        CPPUNIT_ASSERT(chain[0]->findChildrenByClassType("MetaRig").empty());

        const std::vector<MetaNode::Ptr> byName = chain[0]->findChildrenByFilter("link3");
        CPPUNIT_ASSERT_EQUAL(std::size_t(1), byName.size());
        CPPUNIT_ASSERT(*byName.front() == *chain[3]);

        const std::vector<MetaNode::Ptr> byValue = chain[0]->findChildrenByFilter("^le", "side");
        CPPUNIT_ASSERT_EQUAL(std::size_t(1), byValue.size());
        CPPUNIT_ASSERT(*byValue.front() == *chain[2]);
    }

    CPPUNIT_TEST_SUITE(TestMetaTraversal);

    CPPUNIT_TEST( testDepthLimit );
    CPPUNIT_TEST( testOrder );
    CPPUNIT_TEST( testLazyRestart );
    CPPUNIT_TEST( testSharedDescendant );
    CPPUNIT_TEST( testMetaTree );
    CPPUNIT_TEST( testFilters );

    CPPUNIT_TEST_SUITE_END();
};

}
}

