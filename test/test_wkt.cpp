#include <doctest/doctest.h>
#include "Fixtures.hpp"
#include "CadIo.hpp"
#include "Errors.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace cadastre;
using namespace cadastre::test;

TEST_SUITE("WriteWkt") {
  TEST_CASE("one tab-separated line per feature") {
    auto layer = Polygons({Rect(0, 0, 10, 10)});
    layer.add(xy::MultiPolygon{Rect(0, 0, 20, 20)},
              Attributes{{"area", "400.00"}});
    auto os = std::ostringstream{};
    WriteWkt(layer, os);

    auto is = std::istringstream{os.str()};
    auto line = std::string{};
    REQUIRE(std::getline(is, line));
    CHECK(line.rfind("0\t100.00\tMULTIPOLYGON(((0 0,0 10,10 10,10 0,0 0)))", 0) == 0);
    REQUIRE(std::getline(is, line));
    CHECK(line.rfind("1\t400.00\tMULTIPOLYGON(((", 0) == 0);
    CHECK_FALSE(std::getline(is, line));
  }

  TEST_CASE("coordinates keep sub-millimetre precision") {
    const auto layer = Polygons({Rect(500000.1234, 0, 500010.5, 10)});
    auto os = std::ostringstream{};
    WriteWkt(layer, os);
    CHECK(os.str().find("500000.1234 0") != std::string::npos);
  }

  TEST_CASE("a file that cannot be created is an I/O error") {
    const auto layer = Polygons({Rect(0, 0, 1, 1)});
    const auto bad = std::filesystem::path{"no_such_dir/sub/out.wkt"};
    CHECK_THROWS_AS(WriteWkt(layer, bad), IoError);
  }

  TEST_CASE("writing to a file") {
    const auto layer = Polygons({Rect(0, 0, 1, 1)});
    const auto path = std::filesystem::temp_directory_path() / "cadastre_test.wkt";
    WriteWkt(layer, path);
    auto is = std::ifstream{path};
    auto line = std::string{};
    REQUIRE(std::getline(is, line));
    CHECK(line.rfind("0\t1.00\t", 0) == 0);
    is.close();
    std::filesystem::remove(path);
  }
}
