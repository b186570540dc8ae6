#include <doctest/doctest.h>
#include "CadCrs.hpp"
#include "Errors.hpp"

using namespace cadastre;

TEST_SUITE("Crs") {
  TEST_CASE("EPSG codes resolve against the built-in table") {
    const auto utm = Crs::Parse("EPSG:32737");
    CHECK(utm.kind() == Crs::Kind::Epsg);
    CHECK(utm.epsg() == 32737);
    CHECK(utm.id() == "EPSG:32737");
    CHECK(utm.isMetric());
    CHECK_FALSE(utm.isGeographic());

    const auto wgs84 = Crs::Parse("epsg:4326");
    CHECK(wgs84.isGeographic());
    CHECK_FALSE(wgs84.isMetric());
    CHECK(wgs84 == Crs::Epsg(4326));
  }

  TEST_CASE("a projection in US survey feet is not metric") {
    const auto ca = Crs::Epsg(2227);
    CHECK_FALSE(ca.isGeographic());
    CHECK_FALSE(ca.isMetric());
  }

  TEST_CASE("LOCAL, AUTO and AEQD") {
    CHECK(Crs::Parse("LOCAL") == Crs::Local());
    CHECK(Crs::Parse(" local ").kind() == Crs::Kind::Local);
    CHECK_THROWS_AS(Crs::Local().parameters(), ConfigError);

    const auto autoCrs = Crs::Parse("AUTO");
    CHECK(autoCrs.kind() == Crs::Kind::Auto);
    CHECK_FALSE(autoCrs.isResolved());
    CHECK_THROWS_AS(autoCrs.parameters(), ConfigError);

    const auto aeqd = Crs::Parse("AEQD:-1.28,36.8");
    CHECK(aeqd.kind() == Crs::Kind::Aeqd);
    CHECK(aeqd.originLat() == doctest::Approx(-1.28));
    CHECK(aeqd.originLon() == doctest::Approx(36.8));
    CHECK(aeqd.isMetric());
    CHECK(aeqd.parameters().begin() != aeqd.parameters().end());
  }

  TEST_CASE("malformed identifiers are configuration errors") {
    CHECK_THROWS_AS(Crs::Parse(""), ConfigError);
    CHECK_THROWS_AS(Crs::Parse("FOO:1"), ConfigError);
    CHECK_THROWS_AS(Crs::Parse("EPSG:abc"), ConfigError);
    CHECK_THROWS_AS(Crs::Parse("EPSG:999999"), ConfigError);
    CHECK_THROWS_AS(Crs::Parse("AEQD:12"), ConfigError);
    CHECK_THROWS_AS(Crs::Parse("AEQD:95,0"), ConfigError);
  }
}
