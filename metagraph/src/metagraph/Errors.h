// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0

#pragma once

// stl
#include <stdexcept>
#include <string>

namespace metagraph {

/**
 * Base of every error raised by the attribute and meta graph layers.
 * Messages always name the node and, where relevant, the attribute involved.
 */
class MetaGraphError : public std::runtime_error
{
public:
    explicit MetaGraphError(const std::string& arg) : std::runtime_error(arg) {}
};

/// Operation on a MetaNode or handle whose host node no longer exists.
class StaleReferenceError : public MetaGraphError
{
public:
    explicit StaleReferenceError(const std::string& arg) : MetaGraphError(arg) {}
    static StaleReferenceError fromNode(const std::string& nodeName);
};

class AttributeAlreadyExistsError : public MetaGraphError
{
public:
    explicit AttributeAlreadyExistsError(const std::string& arg) : MetaGraphError(arg) {}
    static AttributeAlreadyExistsError fromName(const std::string& nodeName,
                                                const std::string& attrName);
};

class AttributeNotFoundError : public MetaGraphError
{
public:
    explicit AttributeNotFoundError(const std::string& arg) : MetaGraphError(arg) {}
    static AttributeNotFoundError fromName(const std::string& nodeName,
                                           const std::string& attrName);
};

/// Non-forced connection onto a destination that already has a source.
class ConnectionConflictError : public MetaGraphError
{
public:
    explicit ConnectionConflictError(const std::string& arg) : MetaGraphError(arg) {}
    static ConnectionConflictError fromPlugs(const std::string& source,
                                             const std::string& destination,
                                             const std::string& reason);
};

class UnsupportedKindOperationError : public MetaGraphError
{
public:
    explicit UnsupportedKindOperationError(const std::string& arg) : MetaGraphError(arg) {}
    static UnsupportedKindOperationError fromKind(const std::string& plugName,
                                                  const std::string& kindName,
                                                  const std::string& operation);
};

/// A node record names an extension that cannot be loaded.
class MissingRequirementError : public MetaGraphError
{
public:
    explicit MissingRequirementError(const std::string& arg) : MetaGraphError(arg) {}
    static MissingRequirementError fromRequirement(const std::string& nodeName,
                                                   const std::string& requirement);
};

/// Host refused a mutation because the node or plug is locked.
class LockedError : public MetaGraphError
{
public:
    explicit LockedError(const std::string& arg) : MetaGraphError(arg) {}
    static LockedError fromNode(const std::string& nodeName, const std::string& operation);
    static LockedError fromPlug(const std::string& plugName, const std::string& operation);
};

class NodeNotFoundError : public MetaGraphError
{
public:
    explicit NodeNotFoundError(const std::string& arg) : MetaGraphError(arg) {}
    static NodeNotFoundError fromName(const std::string& nodeName);
};

/// Value does not have the shape the attribute kind requires.
class InvalidValueError : public MetaGraphError
{
public:
    explicit InvalidValueError(const std::string& arg) : MetaGraphError(arg) {}
    static InvalidValueError fromPlug(const std::string& plugName,
                                      const std::string& kindName,
                                      const std::string& detail);
};

} // namespace metagraph

