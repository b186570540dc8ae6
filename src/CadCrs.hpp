/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski

#pragma once

#include <boost/geometry/srs/projections/dpar.hpp>

#include <string>
#include <string_view>

namespace cadastre {

/// A coordinate reference system identifier.
///
/// Accepted spellings (case-insensitive prefix):
///   EPSG:<code>        an entry of Boost.Geometry's EPSG table
///   LOCAL              planar engineering CRS in metres (no projection)
///   AEQD:<lat>,<lon>   azimuthal equidistant, WGS84, centred on lat/lon
///   AUTO               AEQD centred on the data, resolved at run time
class Crs {
public:
  enum class Kind { Local = 1, Epsg, Aeqd, Auto };

  Crs() = default; // LOCAL

  static Crs Parse(std::string_view id);
  static Crs Epsg(int code);
  static Crs Aeqd(double latDeg, double lonDeg);
  static Crs Local() { return Crs{}; }
  static Crs Auto();

  Kind kind() const noexcept { return _kind; }
  const std::string& id() const noexcept { return _id; }
  int epsg() const noexcept { return _code; }
  double originLat() const noexcept { return _lat; }
  double originLon() const noexcept { return _lon; }

  bool isGeographic() const noexcept { return _geographic; }
  bool isMetric() const noexcept { return _metric; }
  bool isResolved() const noexcept { return _kind != Kind::Auto; }

  /// Projection parameters; throws ConfigError for LOCAL and AUTO.
  boost::geometry::srs::dpar::parameters<> parameters() const;

  bool operator==(const Crs& rhs) const noexcept { return _id == rhs._id; }

private:
  Kind _kind = Kind::Local;
  std::string _id = "LOCAL";
  int _code = 0;
  double _lat = 0.0;
  double _lon = 0.0;
  bool _geographic = false;
  bool _metric = true;
}; // Crs

} // cadastre
