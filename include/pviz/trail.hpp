#pragma once
#include <cstddef>
#include <vector>
#include <pviz/sample.hpp>

namespace pviz {

inline constexpr float  kTrailLineWidth = 3.0f;
inline constexpr double kTrailAlpha     = 0.6;

// Most recent samples of one entity inside the trailing window, ascending by t,
// at most trail_length long (0 is treated as 1).
std::vector<PositionSample> build_trail(const TrackedEntity& entity,
                                        double current_time,
                                        double window_seconds,
                                        std::size_t trail_length);

} // namespace pviz
