#include <catch2/catch_test_macros.hpp>

#include "core/Colormap.h"

#include <limits>

namespace colormap {

TEST_CASE("Every listed colormap can be built", "[colormap]") {
  for (const auto &name : Colormap::names()) {
    CHECK(Colormap::isKnown(name));
    CHECK(Colormap::byName(name).name() == name);
  }
  CHECK_FALSE(Colormap::isKnown("grey"));
  CHECK_FALSE(Colormap::isKnown("VIRIDIS"));
  CHECK_THROWS_AS(Colormap::byName("rainbow"), std::invalid_argument);
}

TEST_CASE("Gray runs from black to white", "[colormap]") {
  const Colormap &gray = Colormap::byName("gray");
  CHECK(gray.at(0).r == 0);
  CHECK(gray.at(255).r == 255);
  CHECK(gray.at(128).r == gray.at(128).g);

  for (int i = 1; i < 256; ++i)
    CHECK(gray.at(static_cast<std::uint8_t>(i)).r >=
          gray.at(static_cast<std::uint8_t>(i - 1)).r);

  // Greys is the inverse
  const Colormap &greys = Colormap::byName("Greys");
  CHECK(greys.at(0).r == 255);
  CHECK(greys.at(255).r == 0);
}

TEST_CASE("Values are scaled into the display range and clamped",
          "[colormap]") {
  const Colormap &gray = Colormap::byName("gray");

  CHECK(gray.map(0.0f, 0.0f, 10.0f).r == 0);
  CHECK(gray.map(10.0f, 0.0f, 10.0f).r == 255);
  CHECK(gray.map(-5.0f, 0.0f, 10.0f).r == 0);
  CHECK(gray.map(50.0f, 0.0f, 10.0f).r == 255);
  CHECK(gray.map(5.0f, 0.0f, 10.0f).r == gray.at(128).r);
  CHECK(gray.map(5.0f, 0.0f, 10.0f).a == 255);
}

TEST_CASE("NaN is transparent", "[colormap]") {
  const Rgba px = Colormap::byName("viridis")
                      .map(std::numeric_limits<float>::quiet_NaN(), 0, 1);
  CHECK(px.a == 0);
  CHECK(px.r == 0);
  CHECK(px.g == 0);
  CHECK(px.b == 0);
}

TEST_CASE("Seismic is white in the middle", "[colormap]") {
  const Colormap &seismic = Colormap::byName("seismic");
  const Rgba mid = seismic.map(0.0f, -1.0f, 1.0f);
  CHECK(mid.r >= 250);
  CHECK(mid.g >= 250);
  CHECK(mid.b >= 250);
  CHECK(seismic.at(0).b > seismic.at(0).r);
  CHECK(seismic.at(255).r > seismic.at(255).b);
}

} // namespace colormap
