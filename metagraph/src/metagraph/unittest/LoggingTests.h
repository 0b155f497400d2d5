// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

#include <cppunit/TestFixture.h>
#include <cppunit/extensions/HelperMacros.h>

#include <metagraph/logging/MetaGraphLogging.h>

#include <string>
#include <vector>

using namespace metagraph;

namespace metagraph {
namespace unittest {

struct CapturedMessage
{
    std::string message;
    MgLoggingSeverity severity;
    std::string module;
    int indent;
};

inline void
captureHandler(const char* message,
               MgLoggingSeverity severity,
               const char* module,
               int indent,
               void* context)
{
    auto* captured = static_cast<std::vector<CapturedMessage>*>(context);
    captured->push_back({ message, severity, module, indent });
}

struct TestLogging : public CppUnit::TestFixture
{
    void testHandlerThreshold()
    {
        std::vector<CapturedMessage> captured;
        void* token = MetaGraphLogging::registerHandler(
                &captureHandler, &captured, kMgLoggingSeverityWarning, "LoggingTest");

        const MetaGraphLogging logger("LoggingTest");
        const MetaGraphLogging other("OtherModule");

        logger.info("below the threshold");
        logger.warning("first");
        logger.error("second");
        other.error("other module");

        CPPUNIT_ASSERT_EQUAL(std::size_t(2), captured.size());
        CPPUNIT_ASSERT_EQUAL(std::string("first"), captured[0].message);
        CPPUNIT_ASSERT_EQUAL(kMgLoggingSeverityWarning, captured[0].severity);
        CPPUNIT_ASSERT_EQUAL(std::string("LoggingTest"), captured[1].module);
        CPPUNIT_ASSERT_EQUAL(kMgLoggingSeverityError, captured[1].severity);

        // the handler asks for warnings from its module only
        CPPUNIT_ASSERT(logger.isSeverityEnabled(kMgLoggingSeverityWarning));

        CPPUNIT_ASSERT(MetaGraphLogging::unregisterHandler(token));
        CPPUNIT_ASSERT(!MetaGraphLogging::unregisterHandler(token));

        logger.error("after unregistering");
        CPPUNIT_ASSERT_EQUAL(std::size_t(2), captured.size());
    }

    void testThreadLogPool()
    {
        std::vector<CapturedMessage> captured;
        void* token = MetaGraphLogging::registerHandler(
                &captureHandler, &captured, kMgLoggingSeverityDebug, "LoggingTest");

        const MetaGraphLogging logger("LoggingTest");
        {
            MetaGraphLogging::ThreadLogPool pool(true, "batch");
            logger.info("one");
            logger.warning("two");

            // held until the pool goes away
            CPPUNIT_ASSERT(captured.empty());
        }

        CPPUNIT_ASSERT_EQUAL(std::size_t(4), captured.size());
        CPPUNIT_ASSERT_EQUAL(std::string("batch --->"), captured[0].message);
        CPPUNIT_ASSERT_EQUAL(kMgLoggingSeverityWarning, captured[0].severity);
        CPPUNIT_ASSERT_EQUAL(std::string("one"), captured[1].message);
        CPPUNIT_ASSERT_EQUAL(1, captured[1].indent);
        CPPUNIT_ASSERT_EQUAL(std::string("<---"), captured[3].message);

        // an empty pool logs nothing
        {
            MetaGraphLogging::ThreadLogPool pool(true, "empty");
        }
        CPPUNIT_ASSERT_EQUAL(std::size_t(4), captured.size());

        MetaGraphLogging::unregisterHandler(token);
    }

    CPPUNIT_TEST_SUITE(TestLogging);

    CPPUNIT_TEST( testHandlerThreshold );
    CPPUNIT_TEST( testThreadLogPool );

    CPPUNIT_TEST_SUITE_END();
};

}
}

