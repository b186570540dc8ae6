/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski

#pragma once
#include "CadLayer.hpp"

#include <optional>

namespace cadastre {

namespace Tune {

/// The block extent is the reserve envelope grown by this many buffer
/// distances on every side.
constexpr double BlockPadding = 5.0;

} // Tune

/// Road-enclosed regions: the padded envelope of `reserve` minus the reserve,
/// one single-part polygon per block, numbered by a "block" attribute.
/// With an empty reserve the padded `extentHint` is returned as one block.
/// Throws GeometryError if there is neither a reserve nor a hint.
Layer ExtractBlocksFromReserve(const Layer& reserve, geom::Distance distance,
                               std::optional<xy::Box> extentHint = std::nullopt);

/// Projects `roads` into `target`, builds the road reserve and extracts
/// the blocks.
Layer ExtractBlocks(const RawLayer& roads, geom::Distance distance,
                    const Crs& target,
                    std::optional<xy::Box> extentHint = std::nullopt);

} // cadastre
