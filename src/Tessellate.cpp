/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski

#include "Tessellate.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <boost/polygon/voronoi.hpp>

#include <boost/geometry/algorithms/convert.hpp>
#include <boost/geometry/algorithms/correct.hpp>
#include <boost/geometry/algorithms/intersection.hpp>

#include <gsl-lite/gsl-lite.hpp>
namespace gsl = gsl_lite;

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <format>
#include <map>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace cadastre {

namespace bp = boost::polygon;

namespace {

using Site = bp::point_data<std::int32_t>;

struct Grid {
  double x0 = 0.0; // metres
  double y0 = 0.0;
  double scale = 1.0; // grid cells per metre

  Site snap(const xy::Point& p) const {
    return Site{static_cast<std::int32_t>(std::lround((geom::Metres(p.x()) - x0) * scale)),
                static_cast<std::int32_t>(std::lround((geom::Metres(p.y()) - y0) * scale))};
  }
  xy::Point unsnap(double gx, double gy) const
    { return MakeXy(x0 + gx / scale, y0 + gy / scale); }
}; // Grid

xy::Box GrowByPercent(const xy::Box& env, double pct) {
  const auto lo = env.min_corner();
  const auto hi = env.max_corner();
  auto w = geom::Metres(hi.x() - lo.x());
  auto h = geom::Metres(hi.y() - lo.y());
  if (w <= 0.0) w = (h > 0.0) ? h : 1.0;
  if (h <= 0.0) h = w;
  const auto dx = geom::FromMetres(w * pct / 100.0);
  const auto dy = geom::FromMetres(h * pct / 100.0);
  return xy::Box{xy::Point{lo.x() - dx, lo.y() - dy},
                 xy::Point{hi.x() + dx, hi.y() + dy}};
} // GrowByPercent

// Walks a bounded Voronoi cell into a closed ring.
xy::Polygon CellPolygon(const bp::voronoi_cell<double>& cell, const Grid& grid) {
  auto poly = xy::Polygon{};
  const auto* edge = cell.incident_edge();
  gsl_Expects(edge != nullptr);
  do {
    const auto* v = edge->vertex0();
    if (!v)
      throw GeometryError{"tessellation: unbounded cell for an interior site"};
    poly.outer().push_back(grid.unsnap(v->x(), v->y()));
    edge = edge->next();
  } while (edge != cell.incident_edge());
  poly.outer().push_back(poly.outer().front());
  ggl::correct(poly);
  return poly;
} // CellPolygon

} // local

Tessellation Tessellate(const Layer& points, double extentBufferPct) {
  if (!(extentBufferPct >= Tune::MinExtentBufferPct
        && extentBufferPct <= Tune::MaxExtentBufferPct))
  {
    throw ConfigError{std::format(
        "extent buffer must be within [{}, {}] percent, got {}",
        Tune::MinExtentBufferPct, Tune::MaxExtentBufferPct, extentBufferPct)};
  }
  if (points.type() != GeometryType::Point)
    throw ConfigError{std::format("tessellate: layer '{}' is {}, not Point",
                                  points.name(), Name(points.type()))};

  auto result = Tessellation{};
  result.pointCount = PointCount(points);
  result.cells = Layer{"voronoi", points.crs(), GeometryType::Polygon};
  result.cells.copySchema(points.fields());

  const auto env = Envelope(points);
  if (!env)
    throw GeometryError{"tessellation needs at least 2 distinct points, got none"};
  const auto clip = GrowByPercent(*env, extentBufferPct);
  const auto extent = std::max(
      geom::Metres(clip.max_corner().x() - clip.min_corner().x()),
      geom::Metres(clip.max_corner().y() - clip.min_corner().y()));

  // Sites and frame must fit in 32-bit grid coordinates.
  auto grid = Grid{};
  grid.x0 = geom::Metres(clip.min_corner().x());
  grid.y0 = geom::Metres(clip.min_corner().y());
  grid.scale = std::min(Tune::MaxGridPerMetre, 1.0e9 / (2.0 * extent));

  // First point at each grid location seeds its cell.
  auto sites = std::vector<Site>{};
  auto origins = std::vector<std::size_t>{};
  auto seen = std::map<std::pair<std::int32_t, std::int32_t>, std::size_t>{};
  for (auto i = std::size_t{0}; i != points.size(); ++i) {
    for (const auto& p: std::get<xy::MultiPoint>(points[i].geometry)) {
      const auto s = grid.snap(p);
      if (!seen.emplace(std::pair{s.x(), s.y()}, sites.size()).second)
        continue;
      sites.push_back(s);
      origins.push_back(i);
    }
  }
  const auto nReal = sites.size();
  if (nReal < 2)
    throw GeometryError{std::format(
        "tessellation needs at least 2 distinct points, got {}", nReal)};

  // Frame sites one extent outside the clip box keep every real cell bounded
  // and small enough that clipping does not lose precision.
  const auto far = static_cast<std::int32_t>(std::lround(1.0 * extent * grid.scale));
  const auto out = static_cast<std::int32_t>(std::lround(2.0 * extent * grid.scale));
  sites.push_back(Site{-far, -far});
  sites.push_back(Site{ out, -far});
  sites.push_back(Site{ out,  out});
  sites.push_back(Site{-far,  out});

  auto vd = bp::voronoi_diagram<double>{};
  bp::construct_voronoi(sites.begin(), sites.end(), &vd);

  auto clipRect = xy::Polygon{};
  ggl::convert(clip, clipRect);
  ggl::correct(clipRect);

  auto bySite = std::vector<std::optional<xy::MultiPolygon>>(nReal);
  for (const auto& cell: vd.cells()) {
    const auto idx = cell.source_index();
    if (idx >= nReal || cell.is_degenerate())
      continue;
    auto clipped = xy::MultiPolygon{};
    ggl::intersection(CellPolygon(cell, grid), clipRect, clipped);
    if (!clipped.empty())
      bySite[idx] = std::move(clipped);
  }

  for (auto s = std::size_t{0}; s != nReal; ++s) {
    if (!bySite[s])
      continue;
    const auto& seed = points[origins[s]];
    result.cells.add(std::move(*bySite[s]), seed.attrs, origins[s]);
  }
  result.cellCount = result.cells.size();
  log::Logger().debug("tessellation: {} points, {} distinct sites, {} cells",
                      result.pointCount, nReal, result.cellCount);
  return result;
} // Tessellate

} // cadastre
