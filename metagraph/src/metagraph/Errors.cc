// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0

#include "Errors.h"

#include <sstream>

namespace metagraph {

StaleReferenceError
StaleReferenceError::fromNode(const std::string& nodeName)
{
    std::stringstream ss;
    ss << "Node '" << nodeName << "' no longer exists";
    return StaleReferenceError(ss.str());
}

AttributeAlreadyExistsError
AttributeAlreadyExistsError::fromName(const std::string& nodeName,
                                      const std::string& attrName)
{
    std::stringstream ss;
    ss << "Attribute '" << attrName << "' already exists on node '" << nodeName << "'";
    return AttributeAlreadyExistsError(ss.str());
}

AttributeNotFoundError
AttributeNotFoundError::fromName(const std::string& nodeName,
                                 const std::string& attrName)
{
    std::stringstream ss;
    ss << "Attribute '" << attrName << "' does not exist on node '" << nodeName << "'";
    return AttributeNotFoundError(ss.str());
}

ConnectionConflictError
ConnectionConflictError::fromPlugs(const std::string& source,
                                   const std::string& destination,
                                   const std::string& reason)
{
    std::stringstream ss;
    ss << "Cannot connect '" << source << "' to '" << destination << "': " << reason;
    return ConnectionConflictError(ss.str());
}

UnsupportedKindOperationError
UnsupportedKindOperationError::fromKind(const std::string& plugName,
                                        const std::string& kindName,
                                        const std::string& operation)
{
    std::stringstream ss;
    ss << "Attribute kind '" << kindName << "' of '" << plugName
       << "' does not support " << operation;
    return UnsupportedKindOperationError(ss.str());
}

MissingRequirementError
MissingRequirementError::fromRequirement(const std::string& nodeName,
                                         const std::string& requirement)
{
    std::stringstream ss;
    ss << "Node '" << nodeName << "' requires extension '" << requirement
       << "' which could not be loaded";
    return MissingRequirementError(ss.str());
}

LockedError
LockedError::fromNode(const std::string& nodeName, const std::string& operation)
{
    std::stringstream ss;
    ss << "Cannot " << operation << ": node '" << nodeName << "' is locked";
    return LockedError(ss.str());
}

LockedError
LockedError::fromPlug(const std::string& plugName, const std::string& operation)
{
    std::stringstream ss;
    ss << "Cannot " << operation << ": attribute '" << plugName << "' is locked";
    return LockedError(ss.str());
}

NodeNotFoundError
NodeNotFoundError::fromName(const std::string& nodeName)
{
    return NodeNotFoundError("No node named '" + nodeName + "'");
}

InvalidValueError
InvalidValueError::fromPlug(const std::string& plugName,
                            const std::string& kindName,
                            const std::string& detail)
{
    std::stringstream ss;
    ss << "Invalid value for '" << plugName << "' of kind '" << kindName << "': " << detail;
    return InvalidValueError(ss.str());
}

} // namespace metagraph

