/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski

#include "Overlay.hpp"
#include "RoadReserve.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <boost/geometry/algorithms/area.hpp>
#include <boost/geometry/algorithms/correct.hpp>
#include <boost/geometry/algorithms/difference.hpp>
#include <boost/geometry/algorithms/envelope.hpp>
#include <boost/geometry/algorithms/intersection.hpp>
#include <boost/geometry/algorithms/union.hpp>
#include <boost/geometry/index/rtree.hpp>

#include <gsl-lite/gsl-lite.hpp>
namespace gsl = gsl_lite;

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace cadastre {

namespace {

using BoxEntry = std::pair<xy::Box, std::size_t>;
using BoxIndex = ggl::index::rtree<BoxEntry, ggl::index::rstar<16>>;

const xy::MultiPolygon& Polygons(const Feature& f) {
  gsl_Expects(std::holds_alternative<xy::MultiPolygon>(f.geometry));
  return std::get<xy::MultiPolygon>(f.geometry);
} // Polygons

void RequirePolygons(const Layer& layer, const char* stage) {
  if (layer.type() != GeometryType::Polygon)
    throw GeometryError{std::string{stage} + ": layer '" + layer.name()
                        + "' is not a polygon layer"};
} // RequirePolygons

std::vector<std::size_t> Overlapping(const BoxIndex& index,
                                     const xy::MultiPolygon& mp)
{
  auto hits = std::vector<BoxEntry>{};
  index.query(ggl::index::intersects(ggl::return_envelope<xy::Box>(mp)),
              std::back_inserter(hits));
  auto out = std::vector<std::size_t>{};
  out.reserve(hits.size());
  for (const auto& h: hits)
    out.push_back(h.second);
  std::ranges::sort(out);
  return out;
} // Overlapping

} // local

std::vector<xy::Polygon> Explode(const xy::MultiPolygon& mp) {
  auto out = std::vector<xy::Polygon>{};
  out.reserve(mp.size());
  for (const auto& poly: mp) {
    if (ggl::area(poly) > 0.0)
      out.push_back(poly);
  }
  return out;
} // Explode(MultiPolygon)

Layer Explode(const Layer& polygons) {
  RequirePolygons(polygons, "explode");
  auto out = Layer{polygons.name(), polygons.crs(), GeometryType::Polygon};
  out.copySchema(polygons.fields());
  for (const auto& f: polygons) {
    for (auto& part: Explode(Polygons(f)))
      out.add(xy::MultiPolygon{std::move(part)}, f.attrs, f.origin);
  }
  return out;
} // Explode(Layer)

xy::MultiPolygon Dissolve(const Layer& polygons) {
  RequirePolygons(polygons, "dissolve");
  auto out = xy::MultiPolygon{};
  for (const auto& f: polygons) {
    auto mp = Polygons(f);
    ggl::correct(mp);
    if (out.empty()) {
      out = std::move(mp);
      continue;
    }
    auto merged = xy::MultiPolygon{};
    ggl::union_(out, mp, merged);
    out = std::move(merged);
  }
  return out;
} // Dissolve

Layer SubtractRoads(const Layer& candidates, const Layer& reserve) {
  RequirePolygons(candidates, "subtract roads");
  const auto roads = Dissolve(reserve);
  EnsureValid(roads, "road reserve");

  // Parts of a dissolved reserve are disjoint, so only the parts that
  // overlap a candidate need to be subtracted from it.
  auto index = BoxIndex{};
  for (auto i = std::size_t{0}; i != roads.size(); ++i)
    index.insert(BoxEntry{ggl::return_envelope<xy::Box>(roads[i]), i});

  auto out = Layer{"parcel_candidates", candidates.crs(), GeometryType::Polygon};
  out.copySchema(candidates.fields());
  auto dropped = 0;
  for (const auto& f: candidates) {
    auto cell = Polygons(f);
    ggl::correct(cell);
    auto local = xy::MultiPolygon{};
    for (auto i: Overlapping(index, cell))
      local.push_back(roads[i]);
    if (local.empty()) {
      out.add(std::move(cell), f.attrs, f.origin);
      continue;
    }
    auto rest = xy::MultiPolygon{};
    ggl::difference(cell, local, rest);
    if (rest.empty() || ggl::area(rest) <= 0.0) {
      ++dropped;
      continue;
    }
    out.add(std::move(rest), f.attrs, f.origin);
  }
  log::Logger().debug("subtract roads: {} candidates, {} fully inside the reserve",
                      candidates.size(), dropped);
  return out;
} // SubtractRoads

Layer ClampToBlocks(const Layer& candidates, const Layer& blocks) {
  RequirePolygons(candidates, "clamp");
  RequirePolygons(blocks, "clamp");

  auto index = BoxIndex{};
  for (auto i = std::size_t{0}; i != blocks.size(); ++i)
    index.insert(BoxEntry{ggl::return_envelope<xy::Box>(Polygons(blocks[i])), i});

  if (std::ranges::find(candidates.fields(), "block") != candidates.fields().end())
    log::Logger().warn("clamp: input attribute 'block' is replaced by the block index");

  auto out = Layer{"parcels", candidates.crs(), GeometryType::Polygon};
  out.copySchema(candidates.fields());
  out.addField("block");
  for (const auto& f: candidates) {
    auto cell = Polygons(f);
    ggl::correct(cell);
    for (auto b: Overlapping(index, cell)) {
      auto clipped = xy::MultiPolygon{};
      ggl::intersection(cell, Polygons(blocks[b]), clipped);
      for (auto& part: Explode(clipped)) {
        auto attrs = f.attrs;
        SetAttr(attrs, "block", std::to_string(b));
        out.add(xy::MultiPolygon{std::move(part)}, std::move(attrs), f.origin);
      }
    }
  }
  if (out.empty() && !candidates.empty())
    log::Logger().warn("clamp: no candidate overlaps any block");
  return out;
} // ClampToBlocks

} // cadastre
