#include <pviz/demo.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace pviz {

static constexpr double kTwoPi = 2.0 * 3.14159265358979323846;

static const char* const kDemoNames[] = {
  "Alex Keane", "Ben Ortiz", "Carl Dumas", "Dan Novak", "Eli Marsh", "Finn Adler",
  "Gus Varela", "Hugo Brandt", "Ivan Sorel", "Jon Pike", "Kai Lund", "Leo Marin",
};

std::vector<TrackedEntity> make_demo_roster(const DemoOptions& opt) {
  std::vector<TrackedEntity> out;
  if (opt.entities == 0 || opt.rate_hz <= 0.0 || opt.duration_s < 0.0) return out;

  const auto& slots = scheme_slots(opt.scheme);
  const std::size_t names = sizeof(kDemoNames) / sizeof(kDemoNames[0]);
  const auto steps = static_cast<std::size_t>(std::floor(opt.duration_s * opt.rate_hz)) + 1;
  const double dt = 1.0 / opt.rate_hz;

  out.reserve(opt.entities);
  for (std::size_t i = 0; i < opt.entities; ++i) {
    const FormationSlot& slot = slots[i % slots.size()];

    TrackedEntity e;
    e.id = "demo_" + std::to_string(i + 1);
    e.display_name = kDemoNames[i % names];
    e.numeric_label = static_cast<int>(i + 1);
    e.role_label = slot.role_label;

    // Orbit parameters: radius in percent, period in seconds.
    const double radius = 4.0 + static_cast<double>(i % 4) * 2.0;
    const double period = 40.0 + static_cast<double>(i % 5) * 12.0;
    const double phase  = static_cast<double>(i) * 0.7;

    e.samples.reserve(steps);
    for (std::size_t k = 0; k < steps; ++k) {
      const double t = static_cast<double>(k) * dt;
      const double a = phase + kTwoPi * t / period;
      const double x = std::clamp(slot.x + radius * std::cos(a), 0.0, 100.0);
      const double y = std::clamp(slot.y + radius * std::sin(a) * 1.5, 0.0, 100.0);
      const double conf = 0.5 + 0.45 * std::sin(a * 0.5 + phase);
      e.samples.push_back(make_sample(x, y, t, std::clamp(conf, 0.0, 1.0)));
    }
    out.push_back(std::move(e));
  }
  return out;
}

} // namespace pviz
