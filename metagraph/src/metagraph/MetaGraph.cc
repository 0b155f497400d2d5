// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#include "MetaGraph.h"

// metagraph
#include "internal/internal_utils.h"
#include <metagraph/attribute/Attribute.h>
#include <metagraph/logging/MetaGraphLogging.h>

// tbb
#include <tbb/global_control.h>
#include <tbb/task_arena.h>

// std
#include <iostream>
#include <memory>
#include <mutex>

namespace {

MgLogSetup("MetaGraph");

constexpr int kAutomaticThreads = -1;

int sNumThreads = kAutomaticThreads;
std::unique_ptr<tbb::global_control> sGC;

std::mutex sRegistryMutex;
std::unique_ptr<metagraph::MetaRegistry> sRegistry;

bool
parseParentCardinality(const std::string& text, metagraph::ParentCardinality& cardinality)
{
    if (text == "single") {
        cardinality = metagraph::ParentCardinality::SINGLE;
        return true;
    }
    if (text == "multiple") {
        cardinality = metagraph::ParentCardinality::MULTIPLE;
        return true;
    }

    return false;
}

} // anonymous namespace

namespace metagraph {

bool
bootstrap(const std::string& katanaRoot)
{
    std::string katanaPath = katanaRoot;
    if (katanaPath.empty()) {
        katanaPath = internal::getEnv("KATANA_ROOT");
        if (katanaPath.empty()) {
            std::cerr << "metagraph::bootstrap - "
                      << "KATANA_ROOT environment variable not set, "
                      << "and katanaRoot was not provided\n";
            return false;
        }
    }

    if (!internal::fileOrDirExists(katanaPath)) {
        std::cerr << "metagraph::bootstrap - Path does not exist: " << katanaPath << "\n";
        return false;
    }

    const std::string katanaPathAbsolute = internal::absolutePath(katanaPath);
    if (!FnAttribute::Bootstrap(katanaPathAbsolute / "ext")) {
        std::cerr << "metagraph::bootstrap - Could not bootstrap FnAttribute from "
                  << katanaPathAbsolute << "\n";
        return false;
    }

    const std::string logLevel = internal::getEnv("METAGRAPH_LOG_LEVEL");
    if (!logLevel.empty() && !MetaGraphLogging::setSeverity(logLevel)) {
        MgLogWarn("Unknown METAGRAPH_LOG_LEVEL '" << logLevel << "'");
    }

    MetaRegistry::Options options;
    const std::string cardinality = internal::getEnv("METAGRAPH_PARENT_CARDINALITY");
    if (!cardinality.empty() && !parseParentCardinality(cardinality, options.parentCardinality)) {
        MgLogWarn("Unknown METAGRAPH_PARENT_CARDINALITY '" << cardinality
                  << "', using 'single'");
    }

    MetaRegistry* registry = nullptr;
    {
        std::lock_guard<std::mutex> lock(sRegistryMutex);
        if (!sRegistry) {
            sRegistry.reset(new MetaRegistry(options));
        } else if (sRegistry->options().parentCardinality != options.parentCardinality) {
            // meta nodes already hold on to the registry
            MgLogWarn("The default registry already exists, "
                      "METAGRAPH_PARENT_CARDINALITY is ignored");
        }
        registry = sRegistry.get();
    }

    const std::string typePath = internal::getEnv("METAGRAPH_TYPE_PATH");
    if (!typePath.empty()) {
        const std::size_t loaded = registry->scanSearchPath(typePath);
        MgLogInfo("Loaded " << loaded << " meta type libraries");
    }

    return true;
}

MetaRegistry&
defaultRegistry()
{
    std::lock_guard<std::mutex> lock(sRegistryMutex);
    if (!sRegistry) {
        sRegistry.reset(new MetaRegistry());
    }

    return *sRegistry;
}

void
setNumberOfThreads(int numThreads)
{
    if (numThreads == 0) {
        sNumThreads = kAutomaticThreads;
        sGC.reset();
        return;
    }

    sNumThreads = numThreads;
    sGC.reset(new tbb::global_control(tbb::global_control::max_allowed_parallelism, sNumThreads));
}

int
getNumberOfThreads()
{
    if (sNumThreads == kAutomaticThreads) {
        return tbb::this_task_arena::max_concurrency();
    }

    return sNumThreads;
}

} // namespace metagraph

