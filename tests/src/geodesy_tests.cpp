#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "core/Geodesy.h"

#include <cmath>
#include <limits>

namespace geodesy {

using Catch::Approx;

TEST_CASE("Haversine distance of known points", "[geodesy]") {
  // One degree of latitude on the mean sphere
  CHECK(Geodesy::haversineMeters({0, 0}, {1, 0}) == Approx(111195.08).margin(1));
  CHECK(Geodesy::haversineMeters({-75, 123}, {-75, 123}) == 0.0);

  // Across the antimeridian the short way round
  const double d = Geodesy::haversineMeters({0, 179.5}, {0, -179.5});
  CHECK(d == Approx(111195.08).margin(1));
}

TEST_CASE("Longitude deltas wrap into [-180, 180)", "[geodesy]") {
  CHECK(Geodesy::wrapLonDelta(0) == 0);
  CHECK(Geodesy::wrapLonDelta(190) == Approx(-170));
  CHECK(Geodesy::wrapLonDelta(-190) == Approx(170));
  CHECK(Geodesy::wrapLonDelta(180) == Approx(-180));
  CHECK(Geodesy::wrapLonDelta(359) == Approx(-1));
}

TEST_CASE("Nearest point on an edge", "[geodesy]") {
  SECTION("Projection falls inside the edge") {
    LatLon q = Geodesy::nearestOnEdge({0.5, 0.2}, {0, 0}, {1, 0});
    CHECK(q.lat == Approx(0.5).margin(1e-9));
    CHECK(q.lon == Approx(0.0).margin(1e-9));
  }
  SECTION("Projection clamps to the end points") {
    LatLon q = Geodesy::nearestOnEdge({2, 0.1}, {0, 0}, {1, 0});
    CHECK(q.lat == Approx(1.0));
    q = Geodesy::nearestOnEdge({-3, 0.1}, {0, 0}, {1, 0});
    CHECK(q.lat == Approx(0.0).margin(1e-12));
  }
  SECTION("Degenerate edge") {
    LatLon q = Geodesy::nearestOnEdge({5, 5}, {1, 1}, {1, 1});
    CHECK(q.lat == 1);
    CHECK(q.lon == 1);
  }
}

TEST_CASE("Distance to a polyline", "[geodesy]") {
  const std::vector<LatLon> line = {{0, 0}, {0, 1}, {0, 2}};

  PolylineHit hit = Geodesy::distanceToPolyline({0.1, 1.5}, line);
  CHECK(hit.vertexIndex == 1);
  CHECK(hit.nearest.lon == Approx(1.5).margin(1e-6));
  CHECK(hit.distanceM == Approx(11119.5).margin(5));

  SECTION("Single vertex") {
    PolylineHit one = Geodesy::distanceToPolyline({1, 0}, {{0, 0}});
    CHECK(one.vertexIndex == 0);
    CHECK(one.distanceM == Approx(111195.08).margin(1));
  }
  SECTION("Empty polyline is rejected") {
    CHECK_THROWS_AS(Geodesy::distanceToPolyline({0, 0}, {}),
                    std::invalid_argument);
  }
}

TEST_CASE("Along-track distance accumulates and skips fill values",
          "[geodesy]") {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  auto d = Geodesy::alongTrackDistances({0, 1, nan, 2}, {0, 0, 0, 0});
  REQUIRE(d.size() == 4);
  CHECK(d[0] == 0);
  CHECK(d[1] == Approx(111195.08).margin(1));
  CHECK(d[2] == d[1]);
  CHECK(d[3] == d[2]);

  CHECK_THROWS_AS(Geodesy::alongTrackDistances({0, 1}, {0}),
                  std::invalid_argument);
}

TEST_CASE("Bounds grow to cover every point", "[geodesy]") {
  GeoBounds b;
  CHECK_FALSE(b.valid);
  b.extend({-70, 10});
  b.extend({-72, 12});
  b.extend({-71, 8});
  CHECK(b.valid);
  CHECK(b.minLat == -72);
  CHECK(b.maxLat == -70);
  CHECK(b.minLon == 8);
  CHECK(b.maxLon == 12);
}

} // namespace geodesy
