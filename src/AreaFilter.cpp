/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski

#include "AreaFilter.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <boost/geometry/algorithms/area.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <variant>

namespace cadastre {

void AreaWindow::validate() const {
  const auto lo = geom::SquareMetres(min);
  const auto hi = geom::SquareMetres(max);
  if (!(lo > 0.0 && std::isfinite(lo)))
    throw ConfigError{std::format("minimum area must be positive and finite, "
                                  "got {} m²", lo)};
  if (!(hi >= 0.0 && std::isfinite(hi)))
    throw ConfigError{std::format("maximum area must be finite and not "
                                  "negative, got {} m²", hi)};
  if (bounded() && min >= max)
    throw ConfigError{std::format(
        "minimum area ({} m²) must be less than maximum area ({} m²)",
        geom::SquareMetres(min), geom::SquareMetres(max))};
} // AreaWindow::validate

Layer FilterByArea(const Layer& polygons, const AreaWindow& window) {
  window.validate();
  if (polygons.type() != GeometryType::Polygon)
    throw ConfigError{std::format("area filter: layer '{}' is {}, not Polygon",
                                  polygons.name(), Name(polygons.type()))};
  if (std::ranges::find(polygons.fields(), "area") != polygons.fields().end())
    log::Logger().warn("area filter: input attribute 'area' is replaced by the "
                       "computed area");

  auto out = Layer{polygons.name(), polygons.crs(), GeometryType::Polygon};
  out.copySchema(polygons.fields());
  out.addField("area");
  for (const auto& f: polygons) {
    const auto a = geom::FromSquareMetres(
        ggl::area(std::get<xy::MultiPolygon>(f.geometry)));
    if (!window.contains(a))
      continue;
    auto attrs = f.attrs;
    SetAttr(attrs, "area", std::format("{:.2f}", geom::SquareMetres(a)));
    out.add(f.geometry, std::move(attrs), f.origin);
  }
  log::Logger().debug("area filter: kept {} of {}", out.size(), polygons.size());
  return out;
} // FilterByArea

} // cadastre
