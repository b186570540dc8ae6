/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski

#include "CadLayer.hpp"
#include "Errors.hpp"

#include <boost/geometry/algorithms/envelope.hpp>
#include <boost/geometry/algorithms/expand.hpp>
#include <boost/geometry/algorithms/is_empty.hpp>
#include <boost/geometry/algorithms/num_points.hpp>

#include <format>
#include <stdexcept>
#include <string>
#include <utility>

namespace cadastre {

const char* Name(GeometryType x) noexcept {
  switch (x) {
    case GeometryType::Point:   return "Point";
    case GeometryType::Line:    return "Line";
    case GeometryType::Polygon: return "Polygon";
    default: return nullptr;
  }
} // Name(GeometryType)

void ThrowTypeMismatch(std::string_view layer,
                       GeometryType expected, GeometryType got)
{
  throw GeometryError{std::format("layer '{}': expected {} geometry, got {}",
                                  layer, Name(expected), Name(got))};
} // ThrowTypeMismatch

MissingInputError::MissingInputError(const std::string& what,
                                     std::vector<std::string> available)
  : std::runtime_error{[&] {
      auto msg = what + "; available layers: [";
      auto first = true;
      for (const auto& n: available) {
        if (!first) msg += ", ";
        msg += '\'' + n + '\'';
        first = false;
      }
      return msg + "]";
    }()}
  , _available{std::move(available)}
{ }

const std::string* FindAttr(const Attributes& attrs, std::string_view key) {
  for (const auto& [k, v]: attrs)
    if (k == key) return &v;
  return nullptr;
} // FindAttr

void SetAttr(Attributes& attrs, std::string_view key, std::string value) {
  for (auto& [k, v]: attrs) {
    if (k == key) {
      v = std::move(value);
      return;
    }
  }
  attrs.emplace_back(std::string{key}, std::move(value));
} // SetAttr

void LayerStore::add(RawLayer layer) {
  if (find(layer.name()))
    throw std::invalid_argument{"LayerStore: duplicate layer name '"
                                + layer.name() + "'"};
  _layers.push_back(std::move(layer));
} // LayerStore::add

const RawLayer* LayerStore::find(std::string_view name) const noexcept {
  for (const auto& l: _layers)
    if (l.name() == name) return &l;
  return nullptr;
} // LayerStore::find

std::vector<std::string> LayerStore::names() const {
  auto out = std::vector<std::string>{};
  out.reserve(_layers.size());
  for (const auto& l: _layers)
    out.push_back(l.name());
  return out;
} // LayerStore::names

namespace {

template<class Box, class LayerT>
std::optional<Box> EnvelopeOf(const LayerT& layer) {
  auto env = std::optional<Box>{};
  for (const auto& f: layer) {
    std::visit([&](const auto& g) {
      if (ggl::is_empty(g))
        return;
      const auto b = ggl::return_envelope<Box>(g);
      if (env)
        ggl::expand(*env, b);
      else
        env = b;
    }, f.geometry);
  }
  return env;
} // EnvelopeOf

} // local

std::optional<xy::Box> Envelope(const Layer& layer)
  { return EnvelopeOf<xy::Box>(layer); }

std::optional<raw::Box> Envelope(const RawLayer& layer)
  { return EnvelopeOf<raw::Box>(layer); }

std::size_t PointCount(const Layer& layer) {
  auto n = std::size_t{0};
  for (const auto& f: layer)
    n += std::visit([](const auto& g) { return ggl::num_points(g); },
                    f.geometry);
  return n;
} // PointCount

} // cadastre
