// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#include "TransformUtil.h"

// metagraph
#include <metagraph/Errors.h>
#include <metagraph/attribute/AttributeUtils.h>
#include <metagraph/scene/Plug.h>

// Imath
#include <OpenEXR/ImathMatrixAlgo.h>

namespace {

using namespace metagraph;

Imath::V3d
readVec3(const NodeHandle& node, const char* attrName, const Imath::V3d& defValue)
{
    const Plug plug(node, attrName);
    if (!plug.isValid()) {
        return defValue;
    }

    return asVec3(plug.value(), defValue);
}

Imath::V3d
toRadians(const Imath::V3d& degrees)
{
    return Imath::V3d(transform::degreesToRadians(degrees.x),
                      transform::degreesToRadians(degrees.y),
                      transform::degreesToRadians(degrees.z));
}

Imath::M44d
rotationMatrix(const Imath::V3d& degrees)
{
    Imath::M44d m;
    m.rotate(toRadians(degrees));
    return m;
}

} // anonymous namespace

namespace metagraph {
namespace transform {

bool
hasTransform(const NodeHandle& node)
{
    return Plug(node, "translate").isValid()
            && Plug(node, "rotate").isValid()
            && Plug(node, "scale").isValid();
}

Imath::M44d
localMatrix(const NodeHandle& node)
{
    if (!hasTransform(node)) {
        return Imath::M44d();
    }

    const Imath::V3d t = readVec3(node, "translate", Imath::V3d(0.0));
    const Imath::V3d r = readVec3(node, "rotate", Imath::V3d(0.0));
    const Imath::V3d s = readVec3(node, "scale", Imath::V3d(1.0));
    const Imath::V3d jo = readVec3(node, "jointOrient", Imath::V3d(0.0));

    // row vectors: S * R * JO * T
    Imath::M44d m;
    m.translate(t);
    m.rotate(toRadians(jo));
    m.rotate(toRadians(r));
    m.scale(s);

    return m;
}

Imath::M44d
worldMatrix(const NodeHandle& node)
{
    Imath::M44d result;
    for (NodeHandle current = node; current.isBound(); current = current.parent()) {
        result = result * localMatrix(current);
    }

    return result;
}

bool
decompose(const Imath::M44d& matrix, Components& components)
{
    Imath::V3d shear;
    Imath::V3d radians;
    if (!Imath::extractSHRT(matrix, components.scale, shear, radians,
                            components.translate, false)) {
        return false;
    }

    components.rotate = Imath::V3d(radiansToDegrees(radians.x),
                                   radiansToDegrees(radians.y),
                                   radiansToDegrees(radians.z));
    return true;
}

void
setLocalMatrix(Modifier& modifier, const NodeHandle& node, const Imath::M44d& local)
{
    if (!hasTransform(node)) {
        throw MetaGraphError("Node '" + node.name() + "' has no transform");
    }

    Imath::M44d matrix = local;

    // take the joint orient out so it is not applied twice
    const Imath::V3d jo = readVec3(node, "jointOrient", Imath::V3d(0.0));
    if (jo != Imath::V3d(0.0)) {
        Components raw;
        if (!decompose(local, raw)) {
            throw InvalidValueError::fromPlug(node.name() + ".matrix", "matrix", "degenerate");
        }

        Imath::M44d withoutOrient;
        withoutOrient.scale(raw.scale);
        const Imath::M44d rotation = rotationMatrix(raw.rotate) * rotationMatrix(jo).inverse();
        matrix = withoutOrient * rotation;
        matrix[3][0] = raw.translate.x;
        matrix[3][1] = raw.translate.y;
        matrix[3][2] = raw.translate.z;
    }

    Components components;
    if (!decompose(matrix, components)) {
        throw InvalidValueError::fromPlug(node.name() + ".matrix", "matrix", "degenerate");
    }

    modifier.setPlugValue(Plug(node, "translate"), fromVec3(components.translate));
    modifier.setPlugValue(Plug(node, "rotate"), fromVec3(components.rotate));
    modifier.setPlugValue(Plug(node, "scale"), fromVec3(components.scale));
}

} // namespace transform
} // namespace metagraph

