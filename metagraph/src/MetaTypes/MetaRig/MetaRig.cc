// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#include "MetaRig.h"

// metagraph
#include <metagraph/Errors.h>
#include <metagraph/attribute/AttributeUtils.h>
#include <metagraph/logging/MetaGraphLogging.h>
#include <metagraph/meta/MetaRegistry.h>

namespace {

MgLogSetup("MetaRig");

using namespace metagraph;

std::string
relationName(const char* prefix, const std::string& name)
{
    return std::string(prefix) + "_" + name;
}

std::string
prefixPattern(const char* prefix)
{
    return "^" + std::string(prefix) + "_";
}

NodeHandle
relationTarget(const MetaNode& metaNode, const std::string& attrName)
{
    const Plug plug = metaNode.attribute(attrName);
    if (plug.isNull()) {
        return NodeHandle();
    }

    const std::vector<Plug> destinations = plug.destinations();
    return destinations.empty() ? NodeHandle() : destinations.front().node();
}

} // anonymous namespace

namespace metagraph {

MetaRig::MetaRig(const MetaRegistry& registry)
    : MetaNode(registry)
{
}

std::vector<MetaAttribute>
MetaRig::metaAttributes() const
{
    std::vector<MetaAttribute> result = MetaNode::metaAttributes();
    result.push_back({ makeAttributeSpec(kRigVersionAttr, AttributeKind::STRING),
                       StringAttribute(kRigVersion), true });
    result.push_back({ makeAttributeSpec(kRigNameAttr, AttributeKind::STRING),
                       StringAttribute(""), true });

    return result;
}

std::string
MetaRig::rigName() const
{
    return stringValue(requireAttribute(kRigNameAttr).value());
}

void
MetaRig::setRigName(const std::string& rigName)
{
    setAttribute(kRigNameAttr, StringAttribute(rigName));
}

std::string
MetaRig::rigVersion() const
{
    return stringValue(requireAttribute(kRigVersionAttr).value());
}

Plug
MetaRig::addRootNode(const NodeHandle& node, const std::string& name)
{
    return connectTo(relationName(kRootPrefix, name), node);
}

Plug
MetaRig::addControl(const NodeHandle& node, const std::string& name)
{
    return connectTo(relationName(kControlPrefix, name), node);
}

Plug
MetaRig::addJoint(const NodeHandle& node, const std::string& name)
{
    return connectTo(relationName(kJointPrefix, name), node);
}

Plug
MetaRig::addSkinJoint(const NodeHandle& node, const std::string& name)
{
    return connectTo(relationName(kSkinJointPrefix, name), node);
}

Plug
MetaRig::addGeo(const NodeHandle& node, const std::string& name)
{
    return connectTo(relationName(kGeoPrefix, name), node);
}

Plug
MetaRig::addProxyGeo(const NodeHandle& node, const std::string& name)
{
    return connectTo(relationName(kProxyGeoPrefix, name), node);
}

NodeHandle
MetaRig::control(const std::string& name, bool recursive) const
{
    const std::string attrName = relationName(kControlPrefix, name);

    NodeHandle result = relationTarget(*this, attrName);
    if (result.isBound() || !recursive) {
        return result;
    }

    for (const MetaNode::Ptr& child : children()) {
        if (child->state() != State::BOUND_INITIALIZED) {
            continue;
        }
        result = relationTarget(*child, attrName);
        if (result.isBound()) {
            break;
        }
    }

    return result;
}

std::vector<NodeHandle>
MetaRig::controls(bool recursive) const
{
    return findConnectedNodesByAttributeName(prefixPattern(kControlPrefix), recursive);
}

std::vector<NodeHandle>
MetaRig::joints(bool recursive) const
{
    return findConnectedNodesByAttributeName(prefixPattern(kJointPrefix), recursive);
}

std::vector<NodeHandle>
MetaRig::skinJoints(bool recursive) const
{
    return findConnectedNodesByAttributeName(prefixPattern(kSkinJointPrefix), recursive);
}

std::vector<NodeHandle>
MetaRig::geometry(bool recursive) const
{
    // GEO_ also starts the proxy relations
    return findConnectedNodesByAttributeName(
            prefixPattern(kGeoPrefix) + "(?!PROXY_)", recursive);
}

std::vector<NodeHandle>
MetaRig::proxyGeometry(bool recursive) const
{
    return findConnectedNodesByAttributeName(prefixPattern(kProxyGeoPrefix), recursive);
}

NodeHandle
MetaRig::rootTransform() const
{
    const std::vector<NodeHandle> roots =
            findConnectedNodesByAttributeName(prefixPattern(kRootPrefix), false);

    return roots.empty() ? NodeHandle() : roots.front();
}

std::shared_ptr<MetaRig>
MetaRig::addSubSystem(const std::string& name)
{
    Scene& scene = *checkedNode().scene();

    std::shared_ptr<MetaRig> subSystem = registry().create<MetaSubSystem>(scene, name);
    if (!subSystem) {
        throw MetaGraphError(std::string(MetaSubSystem::kTypeName) + " is not registered");
    }

    subSystem->setRigName(name);
    addChild(*subSystem);

    MgLogDebug("Added sub system '" << name << "' to '" << checkedNode().name() << "'");
    return subSystem;
}

std::vector<std::shared_ptr<MetaRig>>
MetaRig::subSystems() const
{
    std::vector<std::shared_ptr<MetaRig>> result;
    for (const MetaNode::Ptr& child : findChildrenByClassType(MetaSubSystem::kTypeName, 1)) {
        if (auto subSystem = std::dynamic_pointer_cast<MetaRig>(child)) {
            result.push_back(subSystem);
        }
    }

    return result;
}

std::shared_ptr<MetaRig>
MetaRig::subSystem(const std::string& name) const
{
    for (const std::shared_ptr<MetaRig>& candidate : subSystems()) {
        if (candidate->rigName() == name) {
            return candidate;
        }
    }

    return nullptr;
}

MetaSubSystem::MetaSubSystem(const MetaRegistry& registry)
    : MetaRig(registry)
{
}

} // namespace metagraph

