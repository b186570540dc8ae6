#include <doctest/doctest.h>
#include "Fixtures.hpp"
#include "CadIo.hpp"
#include "Errors.hpp"
#include "Pipeline.hpp"

#include <filesystem>
#include <sstream>
#include <string>

using namespace cadastre;
using namespace cadastre::test;

namespace fs = std::filesystem;

TEST_SUITE("SaveOrDump") {
  TEST_CASE("the output format follows the file extension") {
    CHECK(FormatFor("parcels.shp") == OutputFormat::Shp);
    CHECK(FormatFor("parcels.wkt") == OutputFormat::Wkt);
    CHECK(FormatFor("parcels") == OutputFormat::Wkt);
    CHECK(FromChars<OutputFormat>("shp") == OutputFormat::Shp);
    CHECK_FALSE(FromChars<OutputFormat>("gpkg"));
  }

  TEST_CASE("an unwritable shapefile path dumps WKT to the fallback") {
    const auto layer = Polygons({Rect(0, 0, 10, 10), Rect(20, 0, 30, 10)});
    auto fallback = std::ostringstream{};
    const auto status = SaveOrDump(layer, "no_such_dir/sub/parcels.shp",
                                   OutputFormat::Shp, fallback);
    CHECK(status == SaveStatus::Dumped);
    CHECK(ExitStatus(status) == ExitSaveError);

    auto expected = std::ostringstream{};
    WriteWkt(layer, expected);
    CHECK(fallback.str() == expected.str());
    CHECK(fallback.str().rfind("0\t100.00\tMULTIPOLYGON(((", 0) == 0);
  }

  TEST_CASE("an unwritable WKT path dumps WKT to the fallback") {
    const auto layer = Polygons({Rect(0, 0, 10, 10)});
    auto fallback = std::ostringstream{};
    const auto status = SaveOrDump(layer, "no_such_dir/sub/parcels.wkt",
                                   OutputFormat::Wkt, fallback);
    CHECK(status == SaveStatus::Dumped);
    CHECK(fallback.str().find("MULTIPOLYGON") != std::string::npos);
  }

  TEST_CASE("a successful save leaves the fallback untouched") {
    const auto layer = Polygons({Rect(0, 0, 10, 10)});
    const auto path = fs::temp_directory_path() / "cadastre_save.wkt";
    auto fallback = std::ostringstream{};
    const auto status = SaveOrDump(layer, path, OutputFormat::Wkt, fallback);
    CHECK(status == SaveStatus::Saved);
    CHECK(ExitStatus(status) == ExitSuccess);
    CHECK(fallback.str().empty());
    CHECK(fs::exists(path));
    fs::remove(path);
  }
}

TEST_SUITE("ExitStatus") {
  TEST_CASE("run outcomes map to process exit statuses") {
    CHECK(ExitStatus(Outcome::Succeeded) == 0);
    CHECK(ExitStatus(Outcome::Failed) == 1);
    CHECK(ExitStatus(Outcome::Cancelled) == 130);
    CHECK(ExitUsage == 2);
    CHECK(ExitSaveError == 3);
  }
}
