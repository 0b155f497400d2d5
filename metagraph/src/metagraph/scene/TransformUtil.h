// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

// metagraph
#include <metagraph/scene/Modifier.h>
#include <metagraph/scene/Scene.h>

// Imath
#include <OpenEXR/ImathMatrix.h>
#include <OpenEXR/ImathVec.h>

// stl
#include <cmath>

namespace metagraph {
namespace transform {

inline double
degreesToRadians(double degrees)
{
    constexpr double piOver180 = (M_PI / 180.0);
    return degrees * piOver180;
}

inline double
radiansToDegrees(double radians)
{
    constexpr double k180OverPi = (180.0 / M_PI);
    return radians * k180OverPi;
}

/// True if the node carries translate, rotate and scale.
bool hasTransform(const NodeHandle& node);

/**
 * Matrix built from the node's translate, rotate (degrees, XYZ order) and
 * scale, and jointOrient for joints. Identity for nodes without a transform.
 */
Imath::M44d localMatrix(const NodeHandle& node);

/// Product of the local matrices from the node up to the top of its hierarchy.
Imath::M44d worldMatrix(const NodeHandle& node);

struct Components
{
    Imath::V3d translate { 0.0 };
    Imath::V3d rotate { 0.0 };   // degrees
    Imath::V3d scale { 1.0 };
};

/// Splits a matrix without shear; false if the matrix is degenerate.
bool decompose(const Imath::M44d& matrix, Components& components);

/**
 * Queues the value changes that give node the local matrix. For joints the
 * jointOrient is kept and folded out of the rotation.
 */
void setLocalMatrix(Modifier& modifier, const NodeHandle& node, const Imath::M44d& local);

} // namespace transform
} // namespace metagraph

