/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski

#pragma once
#include "CadLayer.hpp"
#include "Errors.hpp"

#include <boost/geometry/algorithms/is_valid.hpp>

#include <string>

namespace cadastre {

namespace Tune {

/// Points per quarter circle on buffer joins (the QGIS SEGMENTS=8 setting).
constexpr int SegmentsPerQuadrant = 8;
constexpr int CirclePoints = 4 * SegmentsPerQuadrant;

} // Tune

/// Buffers every line by `distance` (flat end caps, round joins) and
/// dissolves the result into a single multi-polygon feature.
/// An empty line layer yields an empty polygon layer.
/// Throws ConfigError for distance <= 0 or a non-line layer.
Layer BuildRoadReserve(const Layer& lines, geom::Distance distance);

template<class Geo>
void EnsureValid(const Geo& geo, const char* what) {
  auto failure = ggl::validity_failure_type{};
  if (ggl::is_valid(geo, failure)) [[likely]]
    return;
  // Orientation is repaired by correct() before every set operation.
  if (failure == ggl::failure_wrong_orientation)
    return;
  auto msg = std::string{what};
  msg += ": invalid geometry: ";
  msg += ggl::validity_failure_type_message(failure);
  throw GeometryError{msg};
} // EnsureValid

} // cadastre
