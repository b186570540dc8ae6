#include <doctest/doctest.h>
#include "Fixtures.hpp"
#include "Pipeline.hpp"
#include "Errors.hpp"


#include <stdexcept>
#include <string>

using namespace cadastre;
using namespace cadastre::test;

TEST_SUITE("Layer") {
  TEST_CASE("a layer rejects features of another geometry type") {
    auto layer = Lines({{{0, 0}, {10, 0}}});
    CHECK(layer.size() == 1);
    CHECK_THROWS_AS(layer.add(xy::MultiPoint{MakeXy(1, 1)}), GeometryError);
    CHECK(layer.size() == 1);
  }

  TEST_CASE("envelope and point count") {
    const auto points = Points({{0, 0}, {30, 10}, {-5, 40}});
    const auto env = Envelope(points);
    REQUIRE(env);
    CHECK(ggl::get<ggl::min_corner, 0>(*env) == doctest::Approx(-5));
    CHECK(ggl::get<ggl::max_corner, 1>(*env) == doctest::Approx(40));
    CHECK(PointCount(points) == 3);
    CHECK_FALSE(Envelope(Layer{"empty", Crs{}, GeometryType::Point}));
  }

  TEST_CASE("attributes") {
    auto attrs = Attributes{{"id", "7"}};
    SetAttr(attrs, "area", "12.00");
    SetAttr(attrs, "id", "8");
    REQUIRE(FindAttr(attrs, "id"));
    CHECK(*FindAttr(attrs, "id") == "8");
    CHECK(attrs.size() == 2);
    CHECK_FALSE(FindAttr(attrs, "block"));
  }

  TEST_CASE("the layer store keeps names unique") {
    auto store = LayerStore{};
    store.add(RawLines("roads", {{{0, 0}, {1, 0}}}, Crs{}));
    CHECK_THROWS_AS(store.add(RawLines("roads", {}, Crs{})),
                    std::invalid_argument);
    CHECK(store.find("roads"));
    CHECK_FALSE(store.find("buildings"));
    CHECK(store.names() == std::vector<std::string>{"roads"});
  }
}

TEST_SUITE("ResolveInputs") {
  LayerStore Store() {
    auto store = LayerStore{};
    store.add(RawLines("roads", {{{0, 0}, {100, 0}}}, Crs{}));
    store.add(RawPoints("buildings", {{10, 10}}, Crs{}));
    return store;
  }

  TEST_CASE("both layers are found in parcel mode") {
    const auto store = Store();
    const auto in = ResolveInputs(store, "roads", "buildings", Mode::Parcels);
    REQUIRE(in.roads);
    REQUIRE(in.points);
    CHECK(in.roads->name() == "roads");
    CHECK(in.points->name() == "buildings");
  }

  TEST_CASE("a missing layer lists the available ones") {
    const auto store = Store();
    try {
      (void) ResolveInputs(store, "streets", "buildings", Mode::Parcels);
      FAIL("expected MissingInputError");
    } catch (const MissingInputError& x) {
      CHECK(x.available().size() == 2);
      CHECK(std::string{x.what()}.find("'streets'") != std::string::npos);
      CHECK(std::string{x.what()}.find("'buildings'") != std::string::npos);
    }
  }

  TEST_CASE("parcel mode needs points, blocks mode does not") {
    const auto store = Store();
    CHECK_THROWS_AS(ResolveInputs(store, "roads", std::nullopt, Mode::Parcels),
                    MissingInputError);
    const auto in = ResolveInputs(store, "roads", std::nullopt, Mode::Blocks);
    CHECK(in.roads);
    CHECK_FALSE(in.points);
  }

  TEST_CASE("swapped layers have the wrong geometry type") {
    const auto store = Store();
    CHECK_THROWS_AS(ResolveInputs(store, "buildings", "roads", Mode::Parcels),
                    MissingInputError);
  }
}
