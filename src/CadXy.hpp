/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski
///
/// Planar geometry models: `xy` for metric layers, `raw` for input
/// coordinates as they arrive from a data source, in any CRS.

#pragma once
#include "geom.hpp"

#include <boost/geometry/core/cs.hpp>
#include <boost/geometry/core/access.hpp>
#include <boost/geometry/core/coordinate_type.hpp>
#include <boost/geometry/core/coordinate_system.hpp>
#include <boost/geometry/core/coordinate_dimension.hpp>
#include <boost/geometry/core/tag.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/multi_point.hpp>
#include <boost/geometry/geometries/multi_linestring.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/ring.hpp>
#include <boost/geometry/geometries/box.hpp>

#include <variant>
#include <type_traits>
#include <cstddef>

namespace boost::geometry::traits {

template<>
struct tag<geom::Pt> { using type = point_tag; };

template<>
struct coordinate_type<geom::Pt> { using type = double; };

template<>
struct coordinate_system<geom::Pt> { using type = cs::cartesian; };

template<>
struct dimension<geom::Pt> : std::integral_constant<std::size_t, 2> { };

template<std::size_t Dim>
requires (Dim == 0 || Dim == 1)
struct access<geom::Pt, Dim> {
  static constexpr double get(const geom::Pt& p)
    { return geom::Metres(p[Dim]); }
  static constexpr void set(geom::Pt& p, double v)
    { p[Dim] = geom::FromMetres(v); }
}; // access

} // boost::geometry::traits

namespace cadastre {

namespace ggl = boost::geometry;

namespace xy {

using Point           = geom::Pt;
using LineString      = ggl::model::linestring<Point>;
using MultiPoint      = ggl::model::multi_point<Point>;
using MultiLineString = ggl::model::multi_linestring<LineString>;
using Ring            = ggl::model::ring<Point, true >;
using Polygon         = ggl::model::polygon<Point>;
using MultiPolygon    = ggl::model::multi_polygon<Polygon>;
using Box             = ggl::model::box<Point>;

/// Order of alternatives follows GeometryType.
using Geometry = std::variant<MultiPoint, MultiLineString, MultiPolygon>;

} // xy

namespace raw {

using Point           = ggl::model::d2::point_xy<double>;
using LineString      = ggl::model::linestring<Point>;
using MultiPoint      = ggl::model::multi_point<Point>;
using MultiLineString = ggl::model::multi_linestring<LineString>;
using Ring            = ggl::model::ring<Point, true >;
using Polygon         = ggl::model::polygon<Point>;
using MultiPolygon    = ggl::model::multi_polygon<Polygon>;
using Box             = ggl::model::box<Point>;

using Geometry = std::variant<MultiPoint, MultiLineString, MultiPolygon>;

} // raw

inline xy::Point MakeXy(double x, double y)
  { return xy::Point{geom::FromMetres(x), geom::FromMetres(y)}; }

// Rebuild a geometry point by point into another point model, preserving
// ring order and part structure.

template<class Out, class In, class Fn>
ggl::model::multi_point<Out>
MapPoints(const ggl::model::multi_point<In>& in, Fn& fn) {
  auto out = ggl::model::multi_point<Out>{};
  out.reserve(in.size());
  for (const auto& p: in)
    out.push_back(fn(p));
  return out;
} // MapPoints(multi_point)

template<class Out, class In, class Fn>
ggl::model::linestring<Out>
MapPoints(const ggl::model::linestring<In>& in, Fn& fn) {
  auto out = ggl::model::linestring<Out>{};
  out.reserve(in.size());
  for (const auto& p: in)
    out.push_back(fn(p));
  return out;
} // MapPoints(linestring)

template<class Out, class In, class Fn>
ggl::model::multi_linestring<ggl::model::linestring<Out>>
MapPoints(const ggl::model::multi_linestring<ggl::model::linestring<In>>& in,
          Fn& fn)
{
  auto out = ggl::model::multi_linestring<ggl::model::linestring<Out>>{};
  out.reserve(in.size());
  for (const auto& ls: in)
    out.push_back(MapPoints<Out>(ls, fn));
  return out;
} // MapPoints(multi_linestring)

template<class Out, class In, class Fn>
ggl::model::polygon<Out>
MapPoints(const ggl::model::polygon<In>& in, Fn& fn) {
  auto out = ggl::model::polygon<Out>{};
  for (const auto& p: in.outer())
    out.outer().push_back(fn(p));
  for (const auto& r: in.inners()) {
    auto& hole = out.inners().emplace_back();
    for (const auto& p: r)
      hole.push_back(fn(p));
  }
  return out;
} // MapPoints(polygon)

template<class Out, class In, class Fn>
ggl::model::multi_polygon<ggl::model::polygon<Out>>
MapPoints(const ggl::model::multi_polygon<ggl::model::polygon<In>>& in, Fn& fn) {
  auto out = ggl::model::multi_polygon<ggl::model::polygon<Out>>{};
  out.reserve(in.size());
  for (const auto& poly: in)
    out.push_back(MapPoints<Out>(poly, fn));
  return out;
} // MapPoints(multi_polygon)

template<class OutGeometry, class InGeometry, class Fn>
OutGeometry MapGeometry(const InGeometry& in, Fn fn) {
  using OutPoint = typename std::variant_alternative_t<0, OutGeometry>::value_type;
  return std::visit([&fn](const auto& g) -> OutGeometry {
    return OutGeometry{MapPoints<OutPoint>(g, fn)};
  }, in);
} // MapGeometry

} // cadastre
