/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski

#pragma once
#include "CadLayer.hpp"

namespace cadastre {

/// Reprojects an input layer into the metric CRS `target`.
/// Feature count, attributes, field schema and origin tags are preserved.
/// Throws ConfigError for an unresolved, geographic or non-metric target,
/// or a LOCAL/non-LOCAL pairing; throws GeometryError if a coordinate
/// cannot be transformed.
Layer Project(const RawLayer& in, const Crs& target);

/// Reprojects a planar layer into another metric CRS.
Layer Project(const Layer& in, const Crs& target);

/// Replaces AUTO by an azimuthal equidistant CRS centred on the roads
/// (or, when there are none, the points).  Other CRSs are returned as is.
Crs ResolveAuto(const Crs& target, const RawLayer& roads,
                const RawLayer* points = nullptr);

} // cadastre
