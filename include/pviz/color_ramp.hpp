#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace pviz {

struct Rgb {
  std::uint8_t r{};
  std::uint8_t g{};
  std::uint8_t b{};
  friend bool operator==(const Rgb&, const Rgb&) = default;
};

struct Rgba {
  std::uint8_t r{};
  std::uint8_t g{};
  std::uint8_t b{};
  double a{1.0};   // [0, 1]
  friend bool operator==(const Rgba&, const Rgba&) = default;
};

inline Rgba with_alpha(Rgb c, double a) { return Rgba{c.r, c.g, c.b, a}; }

// Heat gradient over five 0.2-wide segments:
// blue -> cyan -> green -> yellow -> orange -> red.
// Inputs outside [0,1] (and NaN) are clamped; channels are rounded.
Rgb color_ramp(double intensity);

// h in degrees, s/l in [0,1].
Rgb hsl_to_rgb(double h_deg, double s, double l);

// Palette keyed by render order: hue = index*60 mod 360, 70% sat, 50% light.
Rgb entity_color(std::size_t index);

// Same palette keyed by a stable hash of the entity id.
Rgb entity_color_for_id(const std::string& id);

} // namespace pviz
