/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski

#include "Project.hpp"
#include "CadGeo.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <boost/geometry/srs/transformation.hpp>
#include <boost/geometry/srs/projections/exception.hpp>

#include <format>
#include <string>
#include <utility>
#include <variant>

namespace cadastre {

namespace detail {

// Planar counterpart of each source geometry type.
template<class G> struct Xy { using type = void; };
template<class G> using XyT = Xy<std::remove_cvref_t<G>>::type;

template<> struct Xy<geo::MultiPoint>      { using type = xy::MultiPoint; };
template<> struct Xy<geo::MultiLineString> { using type = xy::MultiLineString; };
template<> struct Xy<geo::MultiPolygon>    { using type = xy::MultiPolygon; };
template<> struct Xy<raw::MultiPoint>      { using type = xy::MultiPoint; };
template<> struct Xy<raw::MultiLineString> { using type = xy::MultiLineString; };
template<> struct Xy<raw::MultiPolygon>    { using type = xy::MultiPolygon; };
template<> struct Xy<xy::MultiPoint>       { using type = xy::MultiPoint; };
template<> struct Xy<xy::MultiLineString>  { using type = xy::MultiLineString; };
template<> struct Xy<xy::MultiPolygon>     { using type = xy::MultiPolygon; };

using Transformation = ggl::srs::transformation<>;

template<class Geometry>
xy::Geometry TransformToXy(const Geometry& in, const Transformation& tr,
                           const std::string& layer)
{
  return std::visit([&](const auto& g) -> xy::Geometry {
    auto out = XyT<decltype(g)>{};
    auto ok = false;
    try {
      ok = tr.forward(g, out);
    } catch (const ggl::projection_exception& x) {
      throw GeometryError{std::format("layer '{}': reprojection failed: {}",
                                      layer, x.what())};
    }
    if (!ok)
      throw GeometryError{std::format(
          "layer '{}': coordinates outside the projection's domain", layer)};
    return out;
  }, in);
} // TransformToXy

Transformation MakeTransformation(const Crs& source, const Crs& target) {
  try {
    return Transformation{source.parameters(), target.parameters()};
  } catch (const ggl::projection_exception& x) {
    throw ConfigError{std::format("cannot transform {} to {}: {}",
                                  source.id(), target.id(), x.what())};
  }
} // MakeTransformation

void CheckTarget(const Crs& source, const Crs& target) {
  if (!target.isResolved())
    throw ConfigError{"target CRS AUTO has not been resolved"};
  const auto srcLocal = (source.kind() == Crs::Kind::Local);
  const auto dstLocal = (target.kind() == Crs::Kind::Local);
  if (srcLocal != dstLocal)
    throw ConfigError{std::format("cannot transform {} to {}",
                                  source.id(), target.id())};
  if (target.isGeographic() || !target.isMetric())
    throw ConfigError{std::format("target CRS {} is not a metric projection",
                                  target.id())};
} // CheckTarget

template<class LayerIn, class Convert>
Layer Rebuild(const LayerIn& in, const Crs& target, Convert convert) {
  auto out = Layer{in.name(), target, in.type()};
  out.copySchema(in.fields());
  out.reserve(in.size());
  for (const auto& f: in)
    out.add(convert(f.geometry), f.attrs, f.origin);
  return out;
} // Rebuild

} // detail

Layer Project(const RawLayer& in, const Crs& target) {
  if (!in.crs().isResolved())
    throw ConfigError{std::format("layer '{}' has no source CRS", in.name())};
  detail::CheckTarget(in.crs(), target);
  log::Logger().debug("projecting '{}' ({} features) from {} to {}",
                      in.name(), in.size(), in.crs().id(), target.id());
  if (in.crs() == target) {
    return detail::Rebuild(in, target, [](const raw::Geometry& g) {
      return MapGeometry<xy::Geometry>(g, [](const raw::Point& p) {
        return MakeXy(ggl::get<0>(p), ggl::get<1>(p));
      });
    });
  }
  const auto tr = detail::MakeTransformation(in.crs(), target);
  if (in.crs().isGeographic()) {
    return detail::Rebuild(in, target, [&](const raw::Geometry& g) {
      return detail::TransformToXy(Geo(g), tr, in.name());
    });
  }
  return detail::Rebuild(in, target, [&](const raw::Geometry& g) {
    return detail::TransformToXy(g, tr, in.name());
  });
} // Project(RawLayer)

Layer Project(const Layer& in, const Crs& target) {
  detail::CheckTarget(in.crs(), target);
  if (in.crs() == target)
    return detail::Rebuild(in, target, [](const xy::Geometry& g) { return g; });
  const auto tr = detail::MakeTransformation(in.crs(), target);
  return detail::Rebuild(in, target, [&](const xy::Geometry& g) {
    return detail::TransformToXy(g, tr, in.name());
  });
} // Project(Layer)

Crs ResolveAuto(const Crs& target, const RawLayer& roads,
                const RawLayer* points)
{
  if (target.isResolved())
    return target;
  const auto* layer = &roads;
  auto env = Envelope(roads);
  if (!env && points) {
    layer = points;
    env = Envelope(*points);
  }
  if (!env)
    throw ConfigError{"AUTO CRS needs at least one input feature"};
  if (!layer->crs().isGeographic())
    throw ConfigError{std::format(
        "AUTO CRS needs geographic input; layer '{}' is {}",
        layer->name(), layer->crs().id())};
  const auto centre = GeoCentre(*env);
  auto crs = Crs::Aeqd(centre.latitude .numerical_value_in(units::deg),
                       centre.longitude.numerical_value_in(units::deg));
  log::Logger().info("AUTO CRS resolved to {}", crs.id());
  return crs;
} // ResolveAuto

} // cadastre
