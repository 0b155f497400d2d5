// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#include "MetaRig.h"

// metagraph
#include <metagraph/meta/MetaRegistry.h>

METAGRAPH_REGISTER_TYPES(registry)
{
    const bool rig = registry.registerType<metagraph::MetaRig>();
    const bool subSystem = registry.registerType<metagraph::MetaSubSystem>();

    return rig || subSystem;
}

