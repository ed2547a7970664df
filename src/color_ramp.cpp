#include <pviz/color_ramp.hpp>
#include <algorithm>
#include <array>
#include <cmath>

namespace pviz {

namespace {

struct Stop { double r, g, b; };

// Stop i sits at intensity 0.2*i
constexpr std::array<Stop, 6> kHeatStops{{
  {  0.0,   0.0, 255.0},  // blue
  {  0.0, 255.0, 255.0},  // cyan
  {  0.0, 255.0,   0.0},  // green
  {255.0, 255.0,   0.0},  // yellow
  {255.0, 127.5,   0.0},  // orange
  {255.0,   0.0,   0.0},  // red
}};

constexpr std::size_t kSegments = kHeatStops.size() - 1;

std::uint8_t to_channel(double v) {
  if (!std::isfinite(v)) return 0;
  return static_cast<std::uint8_t>(std::clamp(std::lround(v), 0L, 255L));
}

double clamp01(double x) {
  if (std::isnan(x)) return 0.0;
  return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
}

} // namespace

Rgb color_ramp(double intensity) {
  const double v = clamp01(intensity);
  // Segment index; 1.0 lands in the last segment with factor 1
  const std::size_t seg = std::min<std::size_t>(static_cast<std::size_t>(v * kSegments), kSegments - 1);
  const double seg_start = static_cast<double>(seg) / kSegments;
  const double factor = std::clamp((v - seg_start) * kSegments, 0.0, 1.0);

  const Stop& a = kHeatStops[seg];
  const Stop& b = kHeatStops[seg + 1];
  return Rgb{
    to_channel(a.r + (b.r - a.r) * factor),
    to_channel(a.g + (b.g - a.g) * factor),
    to_channel(a.b + (b.b - a.b) * factor),
  };
}

Rgb hsl_to_rgb(double h_deg, double s, double l) {
  s = clamp01(s);
  l = clamp01(l);
  double h = std::fmod(h_deg, 360.0);
  if (h < 0.0) h += 360.0;

  const double c = (1.0 - std::fabs(2.0 * l - 1.0)) * s;
  const double hp = h / 60.0;
  const double x = c * (1.0 - std::fabs(std::fmod(hp, 2.0) - 1.0));
  double r1 = 0.0, g1 = 0.0, b1 = 0.0;
  if      (hp < 1.0) { r1 = c; g1 = x; }
  else if (hp < 2.0) { r1 = x; g1 = c; }
  else if (hp < 3.0) { g1 = c; b1 = x; }
  else if (hp < 4.0) { g1 = x; b1 = c; }
  else if (hp < 5.0) { r1 = x; b1 = c; }
  else               { r1 = c; b1 = x; }
  const double m = l - c * 0.5;
  return Rgb{ to_channel((r1 + m) * 255.0), to_channel((g1 + m) * 255.0), to_channel((b1 + m) * 255.0) };
}

Rgb entity_color(std::size_t index) {
  const double hue = static_cast<double>((index * 60) % 360);
  return hsl_to_rgb(hue, 0.70, 0.50);
}

Rgb entity_color_for_id(const std::string& id) {
  // FNV-1a, 32-bit
  std::uint32_t h = 2166136261u;
  for (unsigned char c : id) {
    h ^= c;
    h *= 16777619u;
  }
  return entity_color(h % 6u);
}

} // namespace pviz
