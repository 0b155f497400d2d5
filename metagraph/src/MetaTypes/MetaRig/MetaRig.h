// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

// metagraph
#include <metagraph/meta/MetaNode.h>

// stl
#include <string>
#include <vector>

namespace metagraph {

/**
 * Meta node describing a character rig. The rig's nodes are tracked as
 * named relations whose attribute names carry a role prefix, e.g.
 * "CTRL_armIk" for the control registered as "armIk". Sub systems are meta
 * children of the rig.
 */
class MetaRig : public MetaNode
{
public:
    static constexpr const char* kTypeName = "MetaRig";

    static constexpr const char* kRigVersionAttr = "rigVersion";
    static constexpr const char* kRigNameAttr = "name";
    static constexpr const char* kRigVersion = "1.0.0";

    static constexpr const char* kControlPrefix = "CTRL";
    static constexpr const char* kJointPrefix = "JNT";
    static constexpr const char* kSkinJointPrefix = "SKIN";
    static constexpr const char* kGeoPrefix = "GEO";
    static constexpr const char* kProxyGeoPrefix = "GEO_PROXY";
    static constexpr const char* kRootPrefix = "ROOT";

    explicit MetaRig(const MetaRegistry& registry);

    std::string typeName() const override { return kTypeName; }
    std::vector<MetaAttribute> metaAttributes() const override;

    std::string rigName() const;
    void setRigName(const std::string& rigName);
    std::string rigVersion() const;

    // Each returns the plug of node the relation lands on.
    Plug addRootNode(const NodeHandle& node, const std::string& name);
    Plug addControl(const NodeHandle& node, const std::string& name);
    Plug addJoint(const NodeHandle& node, const std::string& name);
    Plug addSkinJoint(const NodeHandle& node, const std::string& name);
    Plug addGeo(const NodeHandle& node, const std::string& name);
    Plug addProxyGeo(const NodeHandle& node, const std::string& name);

    /// The control registered as name, an unbound handle if there is none.
    NodeHandle control(const std::string& name, bool recursive = true) const;

    std::vector<NodeHandle> controls(bool recursive = true) const;
    std::vector<NodeHandle> joints(bool recursive = true) const;
    std::vector<NodeHandle> skinJoints(bool recursive = true) const;

    /// Geometry without the proxies.
    std::vector<NodeHandle> geometry(bool recursive = true) const;
    std::vector<NodeHandle> proxyGeometry(bool recursive = true) const;

    /// First root node of the rig, an unbound handle if there is none.
    NodeHandle rootTransform() const;

    /**
     * Creates a MetaSubSystem named "<name>_meta" and makes it a meta child
     * of the rig.
     */
    std::shared_ptr<MetaRig> addSubSystem(const std::string& name);

    /// Direct meta children that are sub systems.
    std::vector<std::shared_ptr<MetaRig>> subSystems() const;

    /// The sub system whose rig name is name, nullptr if there is none.
    std::shared_ptr<MetaRig> subSystem(const std::string& name) const;
};

/// Part of a rig (an arm, a face) handled as a rig of its own.
class MetaSubSystem : public MetaRig
{
public:
    static constexpr const char* kTypeName = "MetaSubSystem";

    explicit MetaSubSystem(const MetaRegistry& registry);

    std::string typeName() const override { return kTypeName; }
};

} // namespace metagraph

