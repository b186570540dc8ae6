#include "CadIo.hpp"
#include "Errors.hpp"

#include <boost/geometry/algorithms/area.hpp>
#include <boost/geometry/io/wkt/write.hpp>

#include <filesystem>
#include <format>
#include <fstream>
#include <ostream>
#include <variant>

namespace cadastre {

void WriteWkt(const Layer& layer, std::ostream& os) {
  const auto precision = os.precision(15);
  for (auto i = std::size_t{0}; i != layer.size(); ++i) {
    const auto& f = layer[i];
    os << i << '\t';
    if (const auto* area = FindAttr(f.attrs, "area")) {
      os << *area;
    } else {
      const auto a = std::visit([](const auto& g) { return ggl::area(g); },
                                f.geometry);
      os << std::format("{:.2f}", a);
    }
    os << '\t';
    std::visit([&os](const auto& g) { os << ggl::wkt(g); }, f.geometry);
    os << '\n';
  }
  os.precision(precision);
  if (!os)
    throw IoError{std::format("layer '{}': WKT write failed", layer.name())};
} // WriteWkt

void WriteWkt(const Layer& layer, const std::filesystem::path& output) {
  auto os = std::ofstream{output, std::ios::binary};
  if (!os) {
    throw IoError{"WriteWkt: cannot write to '"
                  + output.generic_string() + "'"};
  }
  WriteWkt(layer, os);
  os.close();
  if (!os)
    throw IoError{"WriteWkt: error closing '" + output.generic_string() + "'"};
} // WriteWkt

} // cadastre
