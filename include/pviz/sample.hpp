#pragma once
#include <optional>
#include <string>
#include <vector>

namespace pviz {

// One observed position of a tracked entity.
// x/y are percentages of field width/height, not pixels.
struct PositionSample {
  double x{};                // [0, 100]
  double y{};                // [0, 100]
  double t{};                // seconds
  double confidence{};       // [0, 1]
  double intensity{};        // heat weight; defaults to confidence
  std::optional<std::string> action_tag{};
};

inline PositionSample make_sample(double x, double y, double t, double confidence) {
  return PositionSample{x, y, t, confidence, confidence, std::nullopt};
}

struct TrackedEntity {
  std::string id;
  std::string display_name;
  std::optional<int> numeric_label{};   // jersey number
  std::string role_label;               // e.g. "CB"
  std::vector<PositionSample> samples;  // not guaranteed time-sorted
};

// Helper: find entity by id in a roster
inline const TrackedEntity* find_entity(const std::vector<TrackedEntity>& roster,
                                        const std::string& id) {
  for (const auto& e : roster) if (e.id == id) return &e;
  return nullptr;
}

} // namespace pviz
