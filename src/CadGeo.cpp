#include "CadGeo.hpp"

#include <boost/geometry/core/access.hpp>

namespace cadastre {

geo::Geometry Geo(const raw::Geometry& in) {
  return MapGeometry<geo::Geometry>(in, [](const raw::Point& p) {
    return LatLon{ggl::get<1>(p) * units::latitude [units::deg],
                  ggl::get<0>(p) * units::longitude[units::deg]};
  });
} // Geo

LatLon GeoCentre(const raw::Box& env) {
  const auto lon = (ggl::get<ggl::min_corner, 0>(env)
                  + ggl::get<ggl::max_corner, 0>(env)) / 2;
  const auto lat = (ggl::get<ggl::min_corner, 1>(env)
                  + ggl::get<ggl::max_corner, 1>(env)) / 2;
  return LatLon{lat * units::latitude[units::deg],
                lon * units::longitude[units::deg]};
} // GeoCentre

} // cadastre
