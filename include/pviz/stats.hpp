#pragma once
#include <cstddef>
#include <vector>
#include <pviz/sample.hpp>

namespace pviz {

// Reference grid for coverage: 20x20 cells of 5% each, independent of surface size.
inline constexpr int kCoverageGridSize = 20;

struct HeatStats {
  std::size_t total_samples{0};
  std::size_t window_samples{0};
  double average_intensity{0.0};  // over all samples
  double max_intensity{0.0};
  double coverage_percent{0.0};   // [0, 100]
};

// Percentage of reference cells touched by at least one sample.
// x or y == 100 lands in the last cell; samples outside [0,100] are skipped.
double coverage_percent(const std::vector<PositionSample>& samples);

HeatStats compute_stats(const std::vector<PositionSample>& all_samples,
                        const std::vector<PositionSample>& window_samples);

} // namespace pviz
