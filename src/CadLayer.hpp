/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski

#pragma once

#include "CadXy.hpp"
#include "CadCrs.hpp"
#include "enum_help.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace cadastre {

enum class GeometryType { Point=1, Line, Polygon };
using GeometryTypes = EnumList<GeometryType, GeometryType::Point,
                               GeometryType::Line, GeometryType::Polygon>;

const char* Name(GeometryType x) noexcept;

template<>
struct EnumValues<GeometryType> : GeometryTypes { };

template<class Geometry>
constexpr GeometryType TypeOf(const Geometry& g) noexcept
  { return static_cast<GeometryType>(g.index() + 1); }

using Attributes = std::vector<std::pair<std::string, std::string>>;

template<class Geometry>
struct BasicFeature {
  Geometry geometry;
  Attributes attrs;
  std::optional<std::size_t> origin; // seeding point, when known
}; // BasicFeature

/// An ordered set of features that share one CRS and one geometry type.
/// Stages never modify a layer they are given; they build a new one.
template<class Geometry>
class BasicLayer {
public:
  using geometry_type = Geometry;
  using Feature = BasicFeature<Geometry>;
  using const_iterator = typename std::vector<Feature>::const_iterator;

  BasicLayer() = default;
  BasicLayer(std::string name, Crs crs, GeometryType type)
    : _name{std::move(name)}, _crs{std::move(crs)}, _type{type} { }

  const std::string& name() const noexcept { return _name; }
  const Crs& crs() const noexcept { return _crs; }
  GeometryType type() const noexcept { return _type; }
  const std::vector<std::string>& fields() const noexcept { return _fields; }

  std::size_t size()  const noexcept { return _features.size(); }
  bool        empty() const noexcept { return _features.empty(); }
  const_iterator begin() const noexcept { return _features.begin(); }
  const_iterator end()   const noexcept { return _features.end(); }
  const Feature& operator[](std::size_t i) const { return _features[i]; }
  const Feature& at(std::size_t i) const { return _features.at(i); }

  void rename(std::string name) { _name = std::move(name); }

  void addField(std::string_view field) {
    for (const auto& f: _fields)
      if (f == field) return;
    _fields.emplace_back(field);
  }

  void copySchema(const std::vector<std::string>& fields) {
    for (const auto& f: fields)
      addField(f);
  }

  /// Throws GeometryError if the feature's geometry type differs from the
  /// layer's.
  void add(Feature feature);

  void add(Geometry geometry, Attributes attrs = {},
           std::optional<std::size_t> origin = std::nullopt)
    { add(Feature{std::move(geometry), std::move(attrs), origin}); }

  void reserve(std::size_t n) { _features.reserve(n); }

private:
  std::string _name;
  Crs _crs;
  GeometryType _type = GeometryType::Polygon;
  std::vector<std::string> _fields;
  std::vector<Feature> _features;
}; // BasicLayer

[[noreturn]] void ThrowTypeMismatch(std::string_view layer,
                                    GeometryType expected, GeometryType got);

template<class Geometry>
void BasicLayer<Geometry>::add(Feature feature) {
  const auto t = TypeOf(feature.geometry);
  if (t != _type) [[unlikely]]
    ThrowTypeMismatch(_name, _type, t);
  _features.push_back(std::move(feature));
} // BasicLayer::add

/// Input layer, coordinates as stored by the source.
using RawLayer = BasicLayer<raw::Geometry>;
using RawFeature = RawLayer::Feature;

/// Planar layer in a metric CRS.
using Layer = BasicLayer<xy::Geometry>;
using Feature = Layer::Feature;

/// Looks up an attribute by name.
const std::string* FindAttr(const Attributes& attrs, std::string_view key);

/// Replaces the attribute's value, or appends it.
void SetAttr(Attributes& attrs, std::string_view key, std::string value);

/// The host's registry of named input layers.
class LayerStore {
public:
  /// Throws std::invalid_argument on a duplicate name.
  void add(RawLayer layer);
  const RawLayer* find(std::string_view name) const noexcept;
  std::vector<std::string> names() const;
  std::size_t size() const noexcept { return _layers.size(); }
  bool empty() const noexcept { return _layers.empty(); }
private:
  std::vector<RawLayer> _layers;
}; // LayerStore

/// Envelope of every feature in a layer, or nullopt for an empty layer.
std::optional<xy::Box>  Envelope(const Layer& layer);
std::optional<raw::Box> Envelope(const RawLayer& layer);

/// Number of vertices (for points, the number of points) in a layer.
std::size_t PointCount(const Layer& layer);

} // cadastre
