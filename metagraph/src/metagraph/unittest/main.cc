// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0

#include <pdevunit/pdevunit.h>

#include "AttributeKindTests.h"
#include "LockGuardTests.h"
#include "LoggingTests.h"
#include "MetaNodeTests.h"
#include "MetaRegistryTests.h"
#include "MetaTraversalTests.h"
#include "ModifierTests.h"
#include "NodeSerializationTests.h"
#include "PlugUtilTests.h"

int
main(int argc, char *argv[])
{
    CPPUNIT_TEST_SUITE_REGISTRATION(metagraph::unittest::TestLogging);
    CPPUNIT_TEST_SUITE_REGISTRATION(metagraph::unittest::TestAttributeKind);
    CPPUNIT_TEST_SUITE_REGISTRATION(metagraph::unittest::TestPlugUtil);
    CPPUNIT_TEST_SUITE_REGISTRATION(metagraph::unittest::TestModifier);
    CPPUNIT_TEST_SUITE_REGISTRATION(metagraph::unittest::TestLockGuard);
    CPPUNIT_TEST_SUITE_REGISTRATION(metagraph::unittest::TestNodeSerialization);
    CPPUNIT_TEST_SUITE_REGISTRATION(metagraph::unittest::TestMetaRegistry);
    CPPUNIT_TEST_SUITE_REGISTRATION(metagraph::unittest::TestMetaNode);
    CPPUNIT_TEST_SUITE_REGISTRATION(metagraph::unittest::TestMetaTraversal);

    return pdevunit::run(argc, argv);
}
