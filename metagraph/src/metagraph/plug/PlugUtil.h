// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

// metagraph
#include <metagraph/attribute/Attribute.h>
#include <metagraph/attribute/AttributeKind.h>
#include <metagraph/scene/Modifier.h>
#include <metagraph/scene/Plug.h>

// stl
#include <string>
#include <utility>
#include <vector>

namespace metagraph {
namespace plug_util {

// Every function taking a Modifier* queues its commands on it when one is
// given, and otherwise applies them immediately as one undoable unit.

//-----------------------------------------
// creation

/**
 * Adds a dynamic attribute described by spec.
 * Throws AttributeAlreadyExistsError if the node already has one of that name.
 */
Plug addAttribute(const NodeHandle& node,
                  const AttributeSpec::Ptr& spec,
                  Modifier* modifier = nullptr);

Plug createAttribute(const NodeHandle& node,
                     const std::string& name,
                     AttributeKind kind,
                     bool isArray = false,
                     Modifier* modifier = nullptr);

/// Adds a compound attribute whose children are copies of the given specs.
Plug addCompoundAttribute(const NodeHandle& node,
                          const std::string& name,
                          const std::vector<AttributeSpec::Ptr>& children,
                          bool isArray = false,
                          Modifier* modifier = nullptr);

//-----------------------------------------
// values

/// Key of an array element in a value group, "i3" for logical index 3.
std::string elementKey(int64_t index);
bool parseElementKey(const std::string& key, int64_t& index);

/**
 * Value of any plug. Arrays become a GroupAttribute keyed by elementKey(),
 * compounds a GroupAttribute keyed by child name; the recursion reaches
 * every leaf. Message plugs have no value and yield an invalid attribute.
 */
Attribute getValue(const Plug& plug);

std::pair<AttributeKind, Attribute> getValueAndKind(const Plug& plug);

/**
 * Sets any plug from a value shaped like getValue() returns. Leaves are
 * converted to their kind, see coerceToKind(). For message plugs a
 * StringAttribute naming another plug ("node.attr") connects this plug to
 * it; an invalid value is ignored.
 *
 * The value is taken apart when the command runs, so the plug may be one
 * added earlier in the same batch.
 */
void setValue(const Plug& plug, const Attribute& value, Modifier* modifier = nullptr);

/// Message plugs: connects plug to other. Other kinds copy other's value.
void setValue(const Plug& plug, const Plug& other, Modifier* modifier = nullptr);

/// True if no leaf at or below the plug holds a value other than its default.
bool isDefaultValue(const Plug& plug);

void resetToDefault(const Plug& plug, Modifier* modifier = nullptr);

/// Every plug at or below this one, leaves last: elements, children, itself.
std::vector<Plug> iterChildren(const Plug& plug);

//-----------------------------------------
// metadata

/// Default of the attribute, an invalid attribute if the kind has none.
Attribute plugDefault(const Plug& plug);

/**
 * Returns false if the kind carries no default.
 * Throws InvalidValueError if the value does not fit the kind.
 */
bool setPlugDefault(const Plug& plug, const Attribute& value, Modifier* modifier = nullptr);

bool hasPlugMin(const Plug& plug);
bool hasPlugMax(const Plug& plug);
bool hasPlugSoftMin(const Plug& plug);
bool hasPlugSoftMax(const Plug& plug);

// Throw UnsupportedKindOperationError for kinds without bounds. Enum bounds
// are the smallest and largest field values. Unset bounds are invalid.
Attribute plugMin(const Plug& plug);
Attribute plugMax(const Plug& plug);
Attribute plugSoftMin(const Plug& plug);
Attribute plugSoftMax(const Plug& plug);

// Return false, changing nothing, if the kind has no settable bounds or the
// value does not fit the kind.
bool setPlugMin(const Plug& plug, const Attribute& value, Modifier* modifier = nullptr);
bool setPlugMax(const Plug& plug, const Attribute& value, Modifier* modifier = nullptr);
bool setPlugSoftMin(const Plug& plug, const Attribute& value, Modifier* modifier = nullptr);
bool setPlugSoftMax(const Plug& plug, const Attribute& value, Modifier* modifier = nullptr);

/// Field names of an enum plug in field order, empty for other kinds.
StringVector enumNames(const Plug& plug);
IntVector enumIndices(const Plug& plug);

//-----------------------------------------
// arrays

/// First existing element without connections, else the one past the last.
Plug nextAvailableElement(const Plug& arrayPlug);

void removeElement(const Plug& arrayPlug, int64_t index, Modifier* modifier = nullptr);

/// Removes elements with no connection at or below them.
void removeUnconnectedEmptyElements(const Plug& arrayPlug, Modifier* modifier = nullptr);

//-----------------------------------------
// connections and locks

/**
 * Connects source to destination. An existing incoming connection on the
 * destination is replaced when force is set, else ConnectionConflictError
 * is thrown.
 */
void connectPlugs(const Plug& source,
                  const Plug& destination,
                  bool force = false,
                  Modifier* modifier = nullptr);

/**
 * Disconnects the incoming connection (source) and/or the outgoing ones
 * (destination), unlocking the destination plugs involved first.
 */
void disconnectPlug(const Plug& plug,
                    bool source = true,
                    bool destination = true,
                    Modifier* modifier = nullptr);

/**
 * Clears the lock of the plug and of the arrays and compounds above it.
 * Returns the plugs whose lock was cleared, innermost first.
 */
std::vector<Plug> unlockPlug(const Plug& plug, Modifier* modifier = nullptr);

/// Returns true if the lock state changed.
bool setLockState(const Plug& plug, bool state, Modifier* modifier = nullptr);

} // namespace plug_util
} // namespace metagraph

