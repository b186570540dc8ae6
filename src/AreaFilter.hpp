/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski

#pragma once
#include "CadLayer.hpp"

namespace cadastre {

/// Closed interval of acceptable polygon areas; a zero maximum is unbounded.
struct AreaWindow {
  geom::Area min = geom::FromSquareMetres( 250.0);
  geom::Area max = geom::FromSquareMetres(2000.0);

  bool bounded() const noexcept { return max > geom::FromSquareMetres(0.0); }

  bool contains(geom::Area a) const noexcept
    { return a >= min && (!bounded() || a <= max); }

  /// Throws ConfigError unless min is positive and finite, and max is zero
  /// or a finite value above min.
  void validate() const;
}; // AreaWindow

/// Keeps the features whose planar area lies in `window`, appending an
/// "area" attribute in square metres to each.
Layer FilterByArea(const Layer& polygons, const AreaWindow& window);

} // cadastre
