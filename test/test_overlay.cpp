#include <doctest/doctest.h>
#include "Fixtures.hpp"
#include "Overlay.hpp"
#include "Errors.hpp"

#include <boost/geometry/algorithms/covered_by.hpp>
#include <boost/geometry/algorithms/difference.hpp>

#include <algorithm>
#include <string>

using namespace cadastre;
using namespace cadastre::test;

namespace {

Layer Candidate(const xy::Polygon& poly, std::size_t origin) {
  auto layer = Layer{"voronoi", Crs{}, GeometryType::Polygon};
  layer.addField("id");
  layer.add(xy::MultiPolygon{poly}, Attributes{{"id", "a"}}, origin);
  return layer;
} // Candidate

} // local

TEST_SUITE("SubtractRoads") {
  TEST_CASE("a road through a candidate leaves one two-part feature") {
    const auto cells = Candidate(Rect(0, 0, 100, 100), 3);
    const auto reserve = Polygons({Rect(-10, 40, 110, 60)});
    const auto out = SubtractRoads(cells, reserve);
    REQUIRE(out.size() == 1);
    CHECK(Shape(out[0]).size() == 2);
    CHECK(AreaOf(out[0]) == doctest::Approx(8000.0));
    CHECK(out[0].origin == 3);
    CHECK(*FindAttr(out[0].attrs, "id") == "a");
    CHECK(OverlapArea(Shape(out[0]), Shape(reserve[0])) == doctest::Approx(0.0));
  }

  TEST_CASE("candidates away from roads pass unchanged") {
    const auto cells = Candidate(Rect(0, 0, 10, 10), 0);
    const auto out = SubtractRoads(cells, Polygons({Rect(50, 50, 60, 60)}));
    REQUIRE(out.size() == 1);
    CHECK(AreaOf(out[0]) == doctest::Approx(100.0));
  }

  TEST_CASE("a candidate inside the reserve is dropped") {
    const auto cells = Candidate(Rect(45, 45, 55, 55), 0);
    const auto out = SubtractRoads(cells, Polygons({Rect(0, 0, 100, 100)}));
    CHECK(out.empty());
  }

  TEST_CASE("an empty reserve removes nothing") {
    const auto cells = Candidate(Rect(0, 0, 10, 10), 0);
    const auto out = SubtractRoads(cells, Polygons({}));
    CHECK(out.size() == 1);
  }
}

TEST_SUITE("ClampToBlocks") {
  TEST_CASE("a candidate straddling two blocks is split between them") {
    const auto cells = Candidate(Rect(0, 0, 100, 100), 7);
    const auto blocks = Polygons({Rect(0, 0, 50, 100), Rect(50, 0, 100, 100)});
    const auto out = ClampToBlocks(cells, blocks);
    REQUIRE(out.size() == 2);
    for (const auto& f: out) {
      CHECK(AreaOf(f) == doctest::Approx(5000.0));
      CHECK(f.origin == 7);
      CHECK(*FindAttr(f.attrs, "id") == "a");
      const auto* block = FindAttr(f.attrs, "block");
      REQUIRE(block);
      const auto b = std::stoul(*block);
      REQUIRE(b < blocks.size());
      CHECK(ggl::covered_by(Shape(f), Shape(blocks[b])));
    }
    CHECK(*FindAttr(out[0].attrs, "block") != *FindAttr(out[1].attrs, "block"));
  }

  TEST_CASE("touching a block along an edge yields nothing") {
    const auto cells = Candidate(Rect(0, 0, 50, 50), 0);
    const auto out = ClampToBlocks(cells, Polygons({Rect(50, 0, 100, 50)}));
    CHECK(out.empty());
  }

  TEST_CASE("a fragmented intersection becomes several features") {
    const auto cells = Candidate(Rect(0, 0, 100, 10), 1);
    auto blockShape = xy::MultiPolygon{};
    ggl::difference(Rect(0, 0, 100, 100), Rect(40, -1, 60, 20), blockShape);
    auto blocks = Layer{"blocks", Crs{}, GeometryType::Polygon};
    blocks.add(std::move(blockShape));
    const auto out = ClampToBlocks(cells, blocks);
    CHECK(out.size() == 2);
    CHECK(TotalArea(out) == doctest::Approx(800.0));
  }

  TEST_CASE("an input 'block' attribute is replaced, with a warning") {
    auto cells = Layer{"voronoi", Crs{}, GeometryType::Polygon};
    cells.addField("block");
    cells.add(xy::MultiPolygon{Rect(0, 0, 10, 10)}, Attributes{{"block", "B-12"}}, 0);
    const auto blocks = Polygons({Rect(-5, -5, 20, 20)});

    auto capture = LogCapture{};
    const auto out = ClampToBlocks(cells, blocks);
    REQUIRE(out.size() == 1);
    CHECK(*FindAttr(out[0].attrs, "block") == "0");
    CHECK(out[0].attrs.size() == 1);
    CHECK(std::ranges::count(out.fields(), "block") == 1);
    CHECK(capture.text().find("'block' is replaced") != std::string::npos);
  }

  TEST_CASE("no warning without a colliding attribute") {
    auto capture = LogCapture{};
    (void) ClampToBlocks(Candidate(Rect(0, 0, 10, 10), 0),
                         Polygons({Rect(-5, -5, 20, 20)}));
    CHECK(capture.text().find("is replaced") == std::string::npos);
  }
}

TEST_SUITE("Explode") {
  TEST_CASE("each part becomes a feature with the same attributes") {
    auto layer = Layer{"mp", Crs{}, GeometryType::Polygon};
    layer.add(xy::MultiPolygon{Rect(0, 0, 1, 1), Rect(5, 5, 7, 7)},
              Attributes{{"k", "v"}}, 2);
    const auto out = Explode(layer);
    REQUIRE(out.size() == 2);
    CHECK(AreaOf(out[0]) + AreaOf(out[1]) == doctest::Approx(5.0));
    CHECK(out[1].origin == 2);
    CHECK(*FindAttr(out[1].attrs, "k") == "v");
  }
}
