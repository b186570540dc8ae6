/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski

#include "RoadReserve.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <boost/geometry/algorithms/buffer.hpp>
#include <boost/geometry/algorithms/correct.hpp>

#include <boost/geometry/strategies/agnostic/buffer_distance_symmetric.hpp>
#include <boost/geometry/strategies/cartesian/buffer_side_straight.hpp>
#include <boost/geometry/strategies/cartesian/buffer_join_round.hpp>
#include <boost/geometry/strategies/cartesian/buffer_end_flat.hpp>
#include <boost/geometry/strategies/cartesian/buffer_point_circle.hpp>

#include <cmath>
#include <format>
#include <variant>

namespace cadastre {

Layer BuildRoadReserve(const Layer& lines, geom::Distance distance) {
  if (const auto d = geom::Metres(distance); !(d > 0.0 && std::isfinite(d)))
    throw ConfigError{std::format("buffer distance must be positive and finite, "
                                  "got {} m", d)};
  if (lines.type() != GeometryType::Line)
    throw ConfigError{std::format("road reserve: layer '{}' is {}, not Line",
                                  lines.name(), Name(lines.type()))};

  auto reserve = Layer{"road_reserve", lines.crs(), GeometryType::Polygon};

  auto network = xy::MultiLineString{};
  auto skipped = 0;
  for (const auto& f: lines) {
    for (const auto& ls: std::get<xy::MultiLineString>(f.geometry)) {
      if (ls.size() < 2) {
        ++skipped;
        continue;
      }
      network.push_back(ls);
    }
  }
  if (skipped)
    log::Logger().debug("road reserve: skipped {} degenerate lines", skipped);
  if (network.empty()) {
    log::Logger().warn("road reserve: no road lines, reserve is empty");
    return reserve;
  }

  auto dist  = ggl::strategy::buffer::distance_symmetric<double>{
                   geom::Metres(distance)};
  auto side  = ggl::strategy::buffer::side_straight{};
  auto join  = ggl::strategy::buffer::join_round{Tune::CirclePoints};
  auto end   = ggl::strategy::buffer::end_flat{};
  auto point = ggl::strategy::buffer::point_circle{Tune::CirclePoints};

  // Buffering the network as one geometry dissolves the overlaps.
  auto area = xy::MultiPolygon{};
  ggl::buffer(network, area, dist, side, join, end, point);
  ggl::correct(area);
  EnsureValid(area, "road reserve");
  log::Logger().debug("road reserve: {} lines -> {} polygons",
                      network.size(), area.size());
  reserve.add(std::move(area));
  return reserve;
} // BuildRoadReserve

} // cadastre
