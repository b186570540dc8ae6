// Small layers in a LOCAL metric CRS for the stage tests.

#pragma once
#include "CadLayer.hpp"
#include "Log.hpp"

#include <boost/geometry/algorithms/area.hpp>
#include <boost/geometry/algorithms/intersection.hpp>

#include <spdlog/sinks/ostream_sink.h>

#include <algorithm>
#include <memory>
#include <sstream>

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace cadastre::test {

using XyList = std::vector<std::pair<double, double>>;

inline xy::LineString Line(const XyList& pts) {
  auto ls = xy::LineString{};
  for (const auto& [x, y]: pts)
    ls.push_back(MakeXy(x, y));
  return ls;
} // Line

/// Axis-aligned rectangle, clockwise and closed.
inline xy::Polygon Rect(double x0, double y0, double x1, double y1) {
  auto poly = xy::Polygon{};
  poly.outer() = xy::Ring{MakeXy(x0, y0), MakeXy(x0, y1), MakeXy(x1, y1),
                          MakeXy(x1, y0), MakeXy(x0, y0)};
  return poly;
} // Rect

inline Layer Lines(const std::vector<XyList>& lines, const Crs& crs = Crs{}) {
  auto layer = Layer{"roads", crs, GeometryType::Line};
  for (const auto& l: lines)
    layer.add(xy::MultiLineString{Line(l)});
  return layer;
} // Lines

inline Layer Points(const XyList& pts, const Crs& crs = Crs{}) {
  auto layer = Layer{"buildings", crs, GeometryType::Point};
  layer.addField("id");
  for (auto i = std::size_t{0}; i != pts.size(); ++i) {
    layer.add(xy::MultiPoint{MakeXy(pts[i].first, pts[i].second)},
              Attributes{{"id", std::to_string(i)}});
  }
  return layer;
} // Points

inline Layer Polygons(const std::vector<xy::Polygon>& polys,
                      const Crs& crs = Crs{})
{
  auto layer = Layer{"polygons", crs, GeometryType::Polygon};
  for (const auto& p: polys)
    layer.add(xy::MultiPolygon{p});
  return layer;
} // Polygons

inline RawLayer RawLines(const std::string& name,
                         const std::vector<XyList>& lines, const Crs& crs)
{
  auto layer = RawLayer{name, crs, GeometryType::Line};
  for (const auto& l: lines) {
    auto ls = raw::LineString{};
    for (const auto& [x, y]: l)
      ls.push_back(raw::Point{x, y});
    layer.add(raw::MultiLineString{ls});
  }
  return layer;
} // RawLines

inline RawLayer RawPoints(const std::string& name, const XyList& pts,
                          const Crs& crs)
{
  auto layer = RawLayer{name, crs, GeometryType::Point};
  layer.addField("id");
  for (auto i = std::size_t{0}; i != pts.size(); ++i) {
    layer.add(raw::MultiPoint{raw::Point{pts[i].first, pts[i].second}},
              Attributes{{"id", std::to_string(i)}});
  }
  return layer;
} // RawPoints

/// Four roads whose 10 m reserve is the frame between [-10,210] and [10,190].
inline std::vector<XyList> SquareRoads() {
  return {
    {{-10.0,   0.0}, {210.0,   0.0}},
    {{-10.0, 200.0}, {210.0, 200.0}},
    {{  0.0, -10.0}, {  0.0, 210.0}},
    {{200.0, -10.0}, {200.0, 210.0}},
  };
} // SquareRoads

inline const xy::MultiPolygon& Shape(const Feature& f)
  { return std::get<xy::MultiPolygon>(f.geometry); }

inline double AreaOf(const Feature& f) { return ggl::area(Shape(f)); }

inline double TotalArea(const Layer& layer) {
  auto sum = 0.0;
  for (const auto& f: layer)
    sum += AreaOf(f);
  return sum;
} // TotalArea

template<class A, class B>
double OverlapArea(const A& a, const B& b) {
  auto out = xy::MultiPolygon{};
  ggl::intersection(a, b, out);
  return ggl::area(out);
} // OverlapArea

/// Copies the "cadastre" log to a string while in scope.
class LogCapture {
public:
  LogCapture()
    : _sink{std::make_shared<spdlog::sinks::ostream_sink_mt>(_os)}
  {
    _sink->set_pattern("%l %v");
    log::Logger().sinks().push_back(_sink);
  }
  ~LogCapture() {
    auto& sinks = log::Logger().sinks();
    sinks.erase(std::remove(sinks.begin(), sinks.end(), _sink), sinks.end());
  }
  LogCapture(const LogCapture&) = delete;
  LogCapture& operator=(const LogCapture&) = delete;

  std::string text() const { return _os.str(); }

private:
  std::ostringstream _os;
  std::shared_ptr<spdlog::sinks::ostream_sink_mt> _sink;
}; // LogCapture

} // cadastre::test
