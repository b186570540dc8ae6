#include <doctest/doctest.h>
#include "Fixtures.hpp"
#include "RoadReserve.hpp"
#include "Errors.hpp"

#include <boost/geometry/algorithms/within.hpp>

#include <limits>

using namespace cadastre;
using namespace cadastre::test;

TEST_SUITE("RoadReserve") {
  TEST_CASE("a straight road buffers to a flat-ended strip") {
    const auto reserve = BuildRoadReserve(Lines({{{0, 0}, {100, 0}}}),
                                          geom::FromMetres(10.0));
    REQUIRE(reserve.size() == 1);
    CHECK(reserve.type() == GeometryType::Polygon);
    CHECK(AreaOf(reserve[0]) == doctest::Approx(2000.0).epsilon(1e-6));
  }

  TEST_CASE("crossing roads dissolve into one feature") {
    const auto reserve = BuildRoadReserve(
        Lines({{{0, 50}, {100, 50}}, {{50, 0}, {50, 100}}}),
        geom::FromMetres(10.0));
    REQUIRE(reserve.size() == 1);
    CHECK(Shape(reserve[0]).size() == 1);
    CHECK(AreaOf(reserve[0]) == doctest::Approx(3600.0).epsilon(1e-6));
  }

  TEST_CASE("the road network frame leaves its interior open") {
    const auto reserve = BuildRoadReserve(Lines(SquareRoads()),
                                          geom::FromMetres(10.0));
    REQUIRE(reserve.size() == 1);
    CHECK(AreaOf(reserve[0]) == doctest::Approx(220.0*220.0 - 180.0*180.0));
    CHECK_FALSE(ggl::within(MakeXy(100, 100), Shape(reserve[0])));
    CHECK(ggl::within(MakeXy(100, 5), Shape(reserve[0])));
  }

  TEST_CASE("no roads, no reserve") {
    const auto reserve = BuildRoadReserve(Lines({}), geom::FromMetres(10.0));
    CHECK(reserve.empty());
    CHECK(reserve.type() == GeometryType::Polygon);
  }

  TEST_CASE("invalid parameters") {
    CHECK_THROWS_AS(BuildRoadReserve(Lines({{{0, 0}, {1, 0}}}),
                                     geom::FromMetres(0.0)), ConfigError);
    CHECK_THROWS_AS(BuildRoadReserve(Lines({{{0, 0}, {1, 0}}}),
                                     geom::FromMetres(-5.0)), ConfigError);
    CHECK_THROWS_AS(BuildRoadReserve(Points({{0, 0}}), geom::FromMetres(10.0)),
                    ConfigError);
  }

  TEST_CASE("a non-finite distance is rejected instead of yielding no reserve") {
    const auto roads = Lines({{{0, 0}, {100, 0}}});
    CHECK_THROWS_AS(BuildRoadReserve(roads,
        geom::FromMetres(std::numeric_limits<double>::quiet_NaN())), ConfigError);
    CHECK_THROWS_AS(BuildRoadReserve(roads,
        geom::FromMetres(std::numeric_limits<double>::infinity())), ConfigError);
  }
}
