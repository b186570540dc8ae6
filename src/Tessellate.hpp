/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski

#pragma once
#include "CadLayer.hpp"

#include <cstddef>

namespace cadastre {

namespace Tune {

constexpr double MinExtentBufferPct =  10.0;
constexpr double MaxExtentBufferPct =  30.0;
constexpr double DefaultExtentBufferPct = 30.0;

/// Finest snapping grid for Voronoi sites, in cells per metre.
constexpr double MaxGridPerMetre = 1000.0;

} // Tune

struct Tessellation {
  Layer cells;                 // one polygon per distinct location
  std::size_t pointCount = 0;  // input locations
  std::size_t cellCount  = 0;
  std::size_t undercount() const noexcept
    { return (pointCount > cellCount) ? pointCount - cellCount : 0; }
}; // Tessellation

/// Partitions the plane around `points` into nearest-point cells, clipped to
/// the point envelope grown by `extentBufferPct` percent of its size.
/// Each cell carries the attributes of its seeding point, whose feature index
/// is the cell's origin.  Points that coincide share one cell.
/// Throws ConfigError for a percentage outside [10, 30] and GeometryError
/// for fewer than two distinct locations.
Tessellation Tessellate(const Layer& points,
                        double extentBufferPct = Tune::DefaultExtentBufferPct);

} // cadastre
