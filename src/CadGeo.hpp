/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski
///
/// Geographic (latitude/longitude) geometry, used only while projecting
/// input layers whose CRS is angular.

#pragma once
#include "CadXy.hpp"

#include <mp-units/systems/isq/space_and_time.h>
#include <mp-units/systems/si.h>
#include <mp-units/framework/quantity.h>

#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/multi_point.hpp>
#include <boost/geometry/geometries/multi_linestring.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/core/cs.hpp>

#include <variant>

namespace cadastre {

namespace units {

constexpr auto deg = mp_units::si::degree;

constexpr struct latitude final
  : mp_units::quantity_spec<mp_units::isq::angular_measure> {} latitude;
constexpr struct longitude final
  : mp_units::quantity_spec<mp_units::isq::angular_measure> {} longitude;

} // units

using LatDeg = mp_units::quantity<units::latitude [units::deg]>;
using LonDeg = mp_units::quantity<units::longitude[units::deg]>;

struct LatLon {
  LatDeg latitude;
  LonDeg longitude;
  LatLon() = default;
  LatLon(LatDeg lat_, LonDeg lon_) : latitude{lat_}, longitude(lon_) { }
}; // LatLon

} // cadastre

namespace boost::geometry::traits {

template<>
struct tag<cadastre::LatLon> { using type = point_tag; };

template<>
struct coordinate_type<cadastre::LatLon> { using type = double; };

template<>
struct coordinate_system<cadastre::LatLon>
  { using type = cs::geographic<degree>; };

template<>
struct dimension<cadastre::LatLon>
  : std::integral_constant<std::size_t, 2> { };

template<std::size_t Dim>
requires (Dim == 0 || Dim == 1)
struct access<cadastre::LatLon, Dim> {
  static constexpr auto deg = mp_units::si::degree;
  static constexpr double get(const cadastre::LatLon& p) {
    if constexpr (Dim == 0)
      return p.longitude.numerical_value_in(deg);
    else
      return p.latitude.numerical_value_in(deg);
  }
  static constexpr void set(cadastre::LatLon& p, double v) {
    if constexpr (Dim == 0)
      p.longitude = v * cadastre::units::longitude[deg];
    else
      p.latitude  = v * cadastre::units::latitude[deg];
  }
}; // access

} // boost::geometry::traits

namespace cadastre {

namespace geo {

using Point           = LatLon;
using LineString      = ggl::model::linestring<Point>;
using MultiPoint      = ggl::model::multi_point<Point>;
using MultiLineString = ggl::model::multi_linestring<LineString>;
using Polygon         = ggl::model::polygon<Point>;
using MultiPolygon    = ggl::model::multi_polygon<Polygon>;
using Box             = ggl::model::box<Point>;

using Geometry = std::variant<MultiPoint, MultiLineString, MultiPolygon>;

} // geo

/// Reinterprets raw (x = longitude, y = latitude) degrees as geographic.
geo::Geometry Geo(const raw::Geometry& in);

/// Centre of the geographic envelope of `in`, as (lat, lon) degrees.
LatLon GeoCentre(const raw::Box& envelope);

} // cadastre
