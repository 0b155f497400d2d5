// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

// metagraph
#include <metagraph/scene/Modifier.h>
#include <metagraph/scene/Plug.h>

namespace metagraph {
namespace plug_util {

/**
 * Definition part of an attribute record:
 * { name, kind, isArray, keyable, channelBox, default?, min?, max?,
 *   softMin?, softMax?, enumOptions?, enumIndices?, children? }
 * children holds one definition record per compound child, keyed "0", "1", ...
 */
GroupAttribute serializeAttributeSpec(const AttributeSpec& spec);

/// Returns nullptr if the record has no name or an unknown kind.
AttributeSpec::Ptr deserializeAttributeSpec(const GroupAttribute& record);

/**
 * Attribute record of a top level plug: the definition record plus
 * { value, isDynamic, locked }, with name set to the plug path.
 *
 * Static attributes still holding their default value produce an invalid
 * GroupAttribute; they are not worth persisting.
 */
GroupAttribute serializePlug(const Plug& plug);

/**
 * Recreates the attribute of a record on node. Dynamic attributes are added
 * with their recorded definition; static ones must already exist and only get
 * their value and flags back. The value is restored before the lock.
 *
 * Throws AttributeAlreadyExistsError for a dynamic attribute the node already
 * has, AttributeNotFoundError for a static one it lacks.
 */
Plug deserializePlug(const NodeHandle& node,
                     const GroupAttribute& record,
                     Modifier* modifier = nullptr);

} // namespace plug_util
} // namespace metagraph

