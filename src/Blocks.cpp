/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski

#include "Blocks.hpp"
#include "Overlay.hpp"
#include "Project.hpp"
#include "RoadReserve.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <boost/geometry/algorithms/convert.hpp>
#include <boost/geometry/algorithms/correct.hpp>
#include <boost/geometry/algorithms/difference.hpp>

#include <cmath>
#include <format>
#include <string>
#include <utility>

namespace cadastre {

namespace {

xy::Box Grow(xy::Box box, geom::Distance pad) {
  auto& lo = box.min_corner();
  auto& hi = box.max_corner();
  lo = xy::Point{lo.x() - pad, lo.y() - pad};
  hi = xy::Point{hi.x() + pad, hi.y() + pad};
  return box;
} // Grow

xy::Polygon Rectangle(const xy::Box& box) {
  auto rect = xy::Polygon{};
  ggl::convert(box, rect);
  ggl::correct(rect);
  return rect;
} // Rectangle

} // local

Layer ExtractBlocksFromReserve(const Layer& reserve, geom::Distance distance,
                               std::optional<xy::Box> extentHint)
{
  if (const auto d = geom::Metres(distance); !(d > 0.0 && std::isfinite(d)))
    throw ConfigError{std::format("block padding distance must be positive "
                                  "and finite, got {} m", d)};
  const auto pad = Tune::BlockPadding * distance;

  auto blocks = Layer{"blocks", reserve.crs(), GeometryType::Polygon};
  blocks.addField("block");

  const auto roads = Dissolve(reserve);
  if (roads.empty()) {
    if (!extentHint)
      throw GeometryError{"blocks: no roads and no extent to enclose"};
    log::Logger().warn("blocks: no roads, the whole extent is one block");
    blocks.add(xy::MultiPolygon{Rectangle(Grow(*extentHint, pad))},
               Attributes{{"block", "0"}});
    return blocks;
  }

  const auto extent = Rectangle(Grow(ggl::return_envelope<xy::Box>(roads), pad));
  auto space = xy::MultiPolygon{};
  ggl::difference(extent, roads, space);
  EnsureValid(space, "blocks");

  auto n = std::size_t{0};
  for (auto& part: Explode(space)) {
    blocks.add(xy::MultiPolygon{std::move(part)},
               Attributes{{"block", std::to_string(n)}});
    ++n;
  }
  log::Logger().debug("blocks: {} blocks from {} reserve polygons",
                      blocks.size(), roads.size());
  return blocks;
} // ExtractBlocksFromReserve

Layer ExtractBlocks(const RawLayer& roads, geom::Distance distance,
                    const Crs& target, std::optional<xy::Box> extentHint)
{
  const auto lines = Project(roads, target);
  const auto reserve = BuildRoadReserve(lines, distance);
  return ExtractBlocksFromReserve(reserve, distance, extentHint);
} // ExtractBlocks

} // cadastre
