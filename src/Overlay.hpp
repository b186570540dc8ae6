/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski
///
/// Boolean overlay stages of the parcel pipeline.

#pragma once
#include "CadLayer.hpp"

#include <vector>

namespace cadastre {

/// Single-part polygons of `mp` with non-zero area.
std::vector<xy::Polygon> Explode(const xy::MultiPolygon& mp);

/// One feature per part; attributes and origin are copied to each part.
Layer Explode(const Layer& polygons);

/// Union of every polygon feature in a layer.
xy::MultiPolygon Dissolve(const Layer& polygons);

/// Removes the road reserve from every candidate.  A candidate split by a
/// road stays a single multi-polygon feature; one that disappears is dropped.
Layer SubtractRoads(const Layer& candidates, const Layer& reserve);

/// Intersects every candidate with every block it overlaps.  Each part of
/// each intersection becomes one feature, tagged with a "block" attribute.
Layer ClampToBlocks(const Layer& candidates, const Layer& blocks);

} // cadastre
