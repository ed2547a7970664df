#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <limits>

#include <pviz/color_ramp.hpp>

using namespace pviz;

TEST_CASE("color_ramp endpoints are blue and red") {
  REQUIRE(color_ramp(0.0) == Rgb{0, 0, 255});
  REQUIRE(color_ramp(1.0) == Rgb{255, 0, 0});
}

TEST_CASE("color_ramp hits every stop at segment boundaries") {
  REQUIRE(color_ramp(0.2) == Rgb{0, 255, 255});   // cyan
  REQUIRE(color_ramp(0.4) == Rgb{0, 255, 0});     // green
  REQUIRE(color_ramp(0.6) == Rgb{255, 255, 0});   // yellow
  REQUIRE(color_ramp(0.8) == Rgb{255, 128, 0});   // orange
}

TEST_CASE("color_ramp interpolates inside a segment") {
  // Half way from blue to cyan
  REQUIRE(color_ramp(0.1) == Rgb{0, 128, 255});
  // Half way from green to yellow
  const Rgb mid = color_ramp(0.5);
  REQUIRE(mid.r >= 127);
  REQUIRE(mid.r <= 128);
  REQUIRE(mid.g == 255);
  REQUIRE(mid.b == 0);
}

TEST_CASE("color_ramp clamps out-of-range and NaN input") {
  REQUIRE(color_ramp(-0.5) == color_ramp(0.0));
  REQUIRE(color_ramp(3.0) == color_ramp(1.0));
  REQUIRE(color_ramp(std::numeric_limits<double>::quiet_NaN()) == color_ramp(0.0));
}

TEST_CASE("color_ramp is continuous across segment boundaries") {
  const double eps = 1e-9;
  for (double b : {0.2, 0.4, 0.6, 0.8}) {
    const Rgb lo = color_ramp(b - eps);
    const Rgb hi = color_ramp(b + eps);
    REQUIRE(std::abs(int(lo.r) - int(hi.r)) <= 1);
    REQUIRE(std::abs(int(lo.g) - int(hi.g)) <= 1);
    REQUIRE(std::abs(int(lo.b) - int(hi.b)) <= 1);
  }
}

TEST_CASE("color_ramp stays in channel range over a sweep") {
  for (int i = 0; i <= 100; ++i) {
    const Rgb c = color_ramp(i / 100.0);
    // uint8_t cannot exceed 255; the sweep checks nothing degenerates to black
    REQUIRE(int(c.r) + int(c.g) + int(c.b) > 0);
  }
}

TEST_CASE("entity_color follows 60 degree hue steps") {
  REQUIRE(entity_color(0) == Rgb{217, 38, 38});
  REQUIRE(entity_color(6) == entity_color(0));
  REQUIRE(entity_color(2) == hsl_to_rgb(120.0, 0.7, 0.5));
  REQUIRE_FALSE(entity_color(1) == entity_color(0));
}

TEST_CASE("hsl_to_rgb handles primaries and grey") {
  REQUIRE(hsl_to_rgb(0.0,   1.0, 0.5) == Rgb{255, 0, 0});
  REQUIRE(hsl_to_rgb(120.0, 1.0, 0.5) == Rgb{0, 255, 0});
  REQUIRE(hsl_to_rgb(240.0, 1.0, 0.5) == Rgb{0, 0, 255});
  REQUIRE(hsl_to_rgb(-120.0, 1.0, 0.5) == Rgb{0, 0, 255});
  REQUIRE(hsl_to_rgb(42.0,  0.0, 0.5) == Rgb{128, 128, 128});
}

TEST_CASE("entity_color_for_id is stable and independent of order") {
  REQUIRE(entity_color_for_id("player-7") == entity_color_for_id("player-7"));
  bool matches_palette = false;
  for (std::size_t i = 0; i < 6; ++i) {
    if (entity_color_for_id("player-7") == entity_color(i)) matches_palette = true;
  }
  REQUIRE(matches_palette);
}
