// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

#include <metagraph/meta/MetaRegistry.h>

#include <string>

namespace metagraph {

/**
 * Initializes FnAttribute from the Katana installation, applies the
 * METAGRAPH_LOG_LEVEL and METAGRAPH_PARENT_CARDINALITY settings and loads
 * the meta types found in the METAGRAPH_TYPE_PATH directories into the
 * default registry. KATANA_ROOT is used when katanaRoot is empty.
 *
 * Calling it again rescans the type path; libraries already loaded are
 * skipped.
 */
bool bootstrap(const std::string& katanaRoot=std::string{});

/**
 * Registry shared by the process. Created with the default options on
 * first use if bootstrap() was not called before.
 */
MetaRegistry& defaultRegistry();

/**
 * Set the number of threads that TBB can use, 0 restores the default.
 */
void setNumberOfThreads(int numThreads);
int getNumberOfThreads();

} // namespace metagraph

