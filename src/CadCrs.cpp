/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski

#include "CadCrs.hpp"
#include "Errors.hpp"

#include <boost/geometry/srs/projections/epsg.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <string>
#include <string_view>
#include <system_error>

namespace cadastre {

namespace dpar = boost::geometry::srs::dpar;

namespace {

bool StartsWithNoCase(std::string_view s, std::string_view prefix) {
  if (s.size() < prefix.size())
    return false;
  return std::equal(prefix.begin(), prefix.end(), s.begin(),
      [](char a, char b) {
        return std::toupper(static_cast<unsigned char>(a))
            == std::toupper(static_cast<unsigned char>(b));
      });
} // StartsWithNoCase

std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
    s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
    s.remove_suffix(1);
  return s;
} // Trim

template<typename T>
T ParseNumber(std::string_view s, std::string_view whole) {
  s = Trim(s);
  auto value = T{};
  const auto* last = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(s.data(), last, value);
  if (ec != std::errc{} || ptr != last)
    throw ConfigError{std::format("invalid CRS identifier '{}'", whole)};
  return value;
} // ParseNumber

bool IsLatLongProj(int proj) noexcept {
  return proj == dpar::proj_longlat || proj == dpar::proj_latlong
      || proj == dpar::proj_lonlat  || proj == dpar::proj_latlon;
} // IsLatLongProj

} // local

Crs Crs::Epsg(int code) {
  const auto params = boost::geometry::projections::detail::epsg_to_parameters(code);
  if (params.begin() == params.end())
    throw ConfigError{std::format("unknown EPSG code {}", code)};
  auto crs = Crs{};
  crs._kind = Kind::Epsg;
  crs._id = std::format("EPSG:{}", code);
  crs._code = code;
  auto hasUnits = false;
  for (const auto& p: params) {
    if (p.is_id_equal(dpar::proj)) {
      if (IsLatLongProj(p.get_value<int>()))
        crs._geographic = true;
    } else if (p.is_id_equal(dpar::units)) {
      hasUnits = true;
      crs._metric = (p.get_value<int>() == dpar::units_m);
    } else if (p.is_id_equal(dpar::to_meter)) {
      hasUnits = true;
      crs._metric = p.is_value_set<double>() && p.get_value<double>() == 1.0;
    }
  }
  if (crs._geographic)
    crs._metric = false;
  else if (!hasUnits)
    crs._metric = true;
  return crs;
} // Crs::Epsg

Crs Crs::Aeqd(double latDeg, double lonDeg) {
  if (!(latDeg >= -90.0 && latDeg <= 90.0 && lonDeg >= -180.0 && lonDeg <= 180.0))
    throw ConfigError{std::format("AEQD origin out of range: {},{}", latDeg, lonDeg)};
  auto crs = Crs{};
  crs._kind = Kind::Aeqd;
  crs._id = std::format("AEQD:{},{}", latDeg, lonDeg);
  crs._lat = latDeg;
  crs._lon = lonDeg;
  return crs;
} // Crs::Aeqd

Crs Crs::Auto() {
  auto crs = Crs{};
  crs._kind = Kind::Auto;
  crs._id = "AUTO";
  return crs;
} // Crs::Auto

Crs Crs::Parse(std::string_view id) {
  const auto s = Trim(id);
  if (s.empty())
    throw ConfigError{"empty CRS identifier"};
  if (StartsWithNoCase(s, "EPSG:"))
    return Epsg(ParseNumber<int>(s.substr(5), id));
  if (StartsWithNoCase(s, "AEQD:")) {
    const auto args = s.substr(5);
    const auto comma = args.find(',');
    if (comma == std::string_view::npos)
      throw ConfigError{std::format("invalid CRS identifier '{}'", id)};
    return Aeqd(ParseNumber<double>(args.substr(0, comma), id),
                ParseNumber<double>(args.substr(comma+1), id));
  }
  if (s.size() == 5 && StartsWithNoCase(s, "LOCAL"))
    return Local();
  if (s.size() == 4 && StartsWithNoCase(s, "AUTO"))
    return Auto();
  throw ConfigError{std::format("unsupported CRS identifier '{}'", id)};
} // Crs::Parse

dpar::parameters<> Crs::parameters() const {
  using namespace dpar;
  switch (_kind) {
    case Kind::Epsg:
      return boost::geometry::projections::detail::epsg_to_parameters(_code);
    case Kind::Aeqd:
      return dpar::parameters<>(proj_aeqd)(ellps_wgs84)(datum_wgs84)
                               (lat_0, _lat)(lon_0, _lon)
                               (x_0, 0)(y_0, 0)(units_m);
    case Kind::Local:
      throw ConfigError{"LOCAL CRS has no projection parameters"};
    case Kind::Auto:
      throw ConfigError{"AUTO CRS must be resolved before use"};
  }
  throw ConfigError{"invalid CRS kind"};
} // Crs::parameters

} // cadastre
