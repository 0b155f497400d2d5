// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#include "NodeType.h"

namespace {

using namespace metagraph;

AttributeSpec::Ptr
staticAttribute(const std::string& name,
                AttributeKind kind,
                const Attribute& defaultValue = Attribute())
{
    auto spec = makeAttributeSpec(name, kind);
    spec->isDynamic = false;
    spec->keyable = true;
    spec->channelBox = true;
    if (defaultValue.isValid()) {
        spec->defaultValue = defaultValue;
    }

    return spec;
}

std::vector<AttributeSpec::Ptr>
transformAttributes()
{
    const double one[] = { 1.0, 1.0, 1.0 };

    return {
        staticAttribute("translate", AttributeKind::DOUBLE3),
        staticAttribute("rotate", AttributeKind::DOUBLE3),
        staticAttribute("scale", AttributeKind::DOUBLE3, DoubleAttribute(one, 3, 3)),
        staticAttribute("visibility", AttributeKind::BOOLEAN, IntAttribute(1)),
    };
}

} // anonymous namespace

namespace metagraph {

NodeTypeRegistry::NodeTypeRegistry()
{
    NodeType network;
    network.name = kNetwork;
    registerType(network);

    NodeType transform;
    transform.name = kTransform;
    transform.isDag = true;
    transform.attributes = transformAttributes();
    registerType(transform);

    NodeType joint;
    joint.name = kJoint;
    joint.isDag = true;
    joint.attributes = transformAttributes();
    joint.attributes.push_back(staticAttribute("jointOrient", AttributeKind::DOUBLE3));
    joint.attributes.push_back(staticAttribute("radius", AttributeKind::DOUBLE, DoubleAttribute(1.0)));
    registerType(joint);
}

bool
NodeTypeRegistry::registerType(const NodeType& nodeType)
{
    return mTypes.emplace(nodeType.name, nodeType).second;
}

const NodeType*
NodeTypeRegistry::find(const std::string& typeName) const
{
    const auto it = mTypes.find(typeName);
    if (it == mTypes.end()) {
        return nullptr;
    }

    return &it->second;
}

std::vector<std::string>
NodeTypeRegistry::typeNames() const
{
    std::vector<std::string> names;
    names.reserve(mTypes.size());
    for (const auto& entry : mTypes) {
        names.push_back(entry.first);
    }

    return names;
}

} // namespace metagraph

