/// @file
/// Reads and writes ESRI shapefiles (SHP/SHX/DBF) through shapelib.
///
/// - Every DBF attribute is read and written as a string.
/// - Polygon rings follow the shapefile convention: clockwise rings are
///   outer boundaries and each counter-clockwise ring is a hole of the
///   preceding outer ring.
/// - Null shapes are skipped with a warning.

#include "CadIo.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <boost/geometry/algorithms/area.hpp>
#include <boost/geometry/algorithms/correct.hpp>

#include <shapefil.h>

#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace cadastre {

namespace {

namespace fs = std::filesystem;

[[noreturn]] void ThrowShpError(const fs::path& path, const std::string& msg) {
  auto str = path.generic_string() + ": " + msg;
  throw IoError{str};
} // ThrowShpError

[[noreturn]] void ThrowShpError(const fs::path& path, int recordIndex0,
                                const std::string& msg)
{
  auto oss = std::ostringstream{};
  oss << path.generic_string() << '(' << (recordIndex0+1) << "): " << msg;
  throw IoError{oss.str()};
} // ThrowShpError

struct ShpCloser {
  void operator()(SHPHandle h) const noexcept { if (h) SHPClose(h); }
}; // ShpCloser
using UniqShpPtr = std::unique_ptr<std::remove_pointer_t<SHPHandle>, ShpCloser>;

struct DbfCloser {
  void operator()(DBFHandle h) const noexcept { if (h) DBFClose(h); }
}; // DbfCloser
using UniqDbfPtr = std::unique_ptr<std::remove_pointer_t<DBFHandle>, DbfCloser>;

struct ObjDestroy {
  void operator()(SHPObject* p) const noexcept { if (p) SHPDestroyObject(p); }
}; // ObjDestroy
using UniqObjPtr = std::unique_ptr<SHPObject, ObjDestroy>;

GeometryType TypeOfShape(int shapeType) {
  switch (shapeType) {
    case SHPT_POINT:      case SHPT_POINTZ:      case SHPT_POINTM:
    case SHPT_MULTIPOINT: case SHPT_MULTIPOINTZ: case SHPT_MULTIPOINTM:
      return GeometryType::Point;
    case SHPT_ARC:        case SHPT_ARCZ:        case SHPT_ARCM:
      return GeometryType::Line;
    case SHPT_POLYGON:    case SHPT_POLYGONZ:    case SHPT_POLYGONM:
      return GeometryType::Polygon;
    default:
      return GeometryType{};
  }
} // TypeOfShape

template<class Range>
Range Part(const SHPObject& obj, int part) {
  const auto start = obj.panPartStart[part];
  const auto end = (part + 1 < obj.nParts) ? obj.panPartStart[part+1]
                                           : obj.nVertices;
  auto out = Range{};
  if (start < 0 || end > obj.nVertices || start >= end)
    return out;
  out.reserve(static_cast<std::size_t>(end - start));
  for (auto i = start; i != end; ++i)
    out.push_back(raw::Point{obj.padfX[i], obj.padfY[i]});
  return out;
} // Part

raw::Geometry ReadGeometry(const fs::path& path, int i,
                           const SHPObject& obj, GeometryType type)
{
  switch (type) {
    case GeometryType::Point: {
      auto mp = raw::MultiPoint{};
      for (auto v = 0; v != obj.nVertices; ++v)
        mp.push_back(raw::Point{obj.padfX[v], obj.padfY[v]});
      return mp;
    }
    case GeometryType::Line: {
      auto ml = raw::MultiLineString{};
      for (auto p = 0; p != obj.nParts; ++p) {
        auto ls = Part<raw::LineString>(obj, p);
        if (ls.empty())
          ThrowShpError(path, i, "invalid part vertex range");
        ml.push_back(std::move(ls));
      }
      return ml;
    }
    case GeometryType::Polygon: {
      auto mp = raw::MultiPolygon{};
      for (auto p = 0; p != obj.nParts; ++p) {
        auto ring = Part<raw::Ring>(obj, p);
        if (ring.empty())
          ThrowShpError(path, i, "invalid part vertex range");
        const auto hole = (ggl::area(ring) < 0.0);
        if (hole && !mp.empty()) {
          mp.back().inners().push_back(std::move(ring));
        } else {
          auto& poly = mp.emplace_back();
          poly.outer().assign(ring.begin(), ring.end());
        }
      }
      ggl::correct(mp);
      return mp;
    }
  }
  ThrowShpError(path, i, "unsupported geometry");
} // ReadGeometry

} // local

RawLayer ReadShp(const fs::path& path, const Crs& crs) {
  if (path.extension() != ".shp") ThrowShpError(path, "expected a .shp file");

  const auto shxPath = fs::path{path}.replace_extension(".shx");
  const auto dbfPath = fs::path{path}.replace_extension(".dbf");

  if (!fs::exists(path))    ThrowShpError(path, "file does not exist");
  if (!fs::exists(shxPath)) ThrowShpError(path, "missing sibling .shx file");
  if (!fs::exists(dbfPath)) ThrowShpError(path, "missing sibling .dbf file");

  // Shapelib classic API uses narrow paths.
  const auto shp = UniqShpPtr{SHPOpen(path.string().c_str(), "rb")};
  if (!shp) ThrowShpError(path, "SHPOpen failed");
  const auto dbf = UniqDbfPtr{DBFOpen(dbfPath.string().c_str(), "rb")};
  if (!dbf) ThrowShpError(path, "DBFOpen failed");

  int shapeType = 0;
  int nEntities = 0;
  double minBound[4] = {};
  double maxBound[4] = {};
  SHPGetInfo(shp.get(), &nEntities, &shapeType, minBound, maxBound);

  const auto type = TypeOfShape(shapeType);
  if (!Name(type))
    ThrowShpError(path, "unsupported shape type " + std::to_string(shapeType));
  if (DBFGetRecordCount(dbf.get()) != nEntities) {
    std::ostringstream oss;
    oss << "record count mismatch: SHP has " << nEntities
        << ", DBF has " << DBFGetRecordCount(dbf.get());
    ThrowShpError(path, oss.str());
  }

  auto layer = RawLayer{path.stem().string(), crs, type};
  const auto nFields = DBFGetFieldCount(dbf.get());
  for (int f = 0; f != nFields; ++f) {
    char name[64] = {};
    int width = 0;
    int decimals = 0;
    (void) DBFGetFieldInfo(dbf.get(), f, name, &width, &decimals);
    layer.addField(name);
  }
  layer.reserve(static_cast<std::size_t>(nEntities));

  auto nulls = 0;
  for (int i = 0; i != nEntities; ++i) {
    const auto obj = UniqObjPtr{SHPReadObject(shp.get(), i)};
    if (!obj) ThrowShpError(path, i, "SHPReadObject failed");
    if (obj->nSHPType == SHPT_NULL || obj->nVertices == 0) {
      ++nulls;
      continue;
    }
    auto attrs = Attributes{};
    attrs.reserve(static_cast<std::size_t>(nFields));
    for (int f = 0; f != nFields; ++f) {
      const char* s = DBFIsAttributeNULL(dbf.get(), i, f)
                    ? "" : DBFReadStringAttribute(dbf.get(), i, f);
      attrs.emplace_back(layer.fields()[f], s ? s : "");
    }
    layer.add(ReadGeometry(path, i, *obj, type), std::move(attrs));
  }
  if (nulls)
    log::Logger().warn("{}: skipped {} null shapes", path.generic_string(), nulls);
  log::Logger().info("read layer '{}': {} {} features",
                     layer.name(), layer.size(), Name(type));
  return layer;
} // ReadShp

void WriteShp(const Layer& layer, const fs::path& path) {
  if (layer.type() != GeometryType::Polygon)
    ThrowShpError(path, "only polygon layers can be written");

  auto base = fs::path{path}.replace_extension();
  const auto shp = UniqShpPtr{SHPCreate(base.string().c_str(), SHPT_POLYGON)};
  if (!shp) ThrowShpError(path, "SHPCreate failed");
  const auto dbf = UniqDbfPtr{DBFCreate(base.string().c_str())};
  if (!dbf) ThrowShpError(path, "DBFCreate failed");

  constexpr int FieldWidth = 254;
  for (const auto& field: layer.fields()) {
    if (DBFAddField(dbf.get(), field.c_str(), FTString, FieldWidth, 0) < 0)
      ThrowShpError(path, "cannot add DBF field '" + field + "'");
  }

  for (auto i = 0; i != static_cast<int>(layer.size()); ++i) {
    const auto& f = layer[i];
    auto xs = std::vector<double>{};
    auto ys = std::vector<double>{};
    auto starts = std::vector<int>{};
    auto addRing = [&](const xy::Ring& ring) {
      starts.push_back(static_cast<int>(xs.size()));
      for (const auto& p: ring) {
        xs.push_back(geom::Metres(p.x()));
        ys.push_back(geom::Metres(p.y()));
      }
    };
    for (const auto& poly: std::get<xy::MultiPolygon>(f.geometry)) {
      addRing(poly.outer());
      for (const auto& hole: poly.inners())
        addRing(hole);
    }
    const auto obj = UniqObjPtr{SHPCreateObject(SHPT_POLYGON, -1,
        static_cast<int>(starts.size()), starts.data(), nullptr,
        static_cast<int>(xs.size()), xs.data(), ys.data(), nullptr, nullptr)};
    if (!obj) ThrowShpError(path, i, "SHPCreateObject failed");
    if (SHPWriteObject(shp.get(), -1, obj.get()) < 0)
      ThrowShpError(path, i, "SHPWriteObject failed");
    for (auto k = 0; k != static_cast<int>(layer.fields().size()); ++k) {
      const auto* value = FindAttr(f.attrs, layer.fields()[k]);
      if (!DBFWriteStringAttribute(dbf.get(), i, k, value ? value->c_str() : ""))
        ThrowShpError(path, i, "DBF write failed for '" + layer.fields()[k] + "'");
    }
  }
  log::Logger().info("wrote {} features to {}", layer.size(), path.generic_string());
} // WriteShp

} // cadastre
