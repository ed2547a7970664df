#include <pviz/stats.hpp>
#include <algorithm>
#include <cmath>

namespace pviz {

static int reference_cell(double v) {
  const int idx = static_cast<int>(std::floor(v / 100.0 * kCoverageGridSize));
  return std::min(idx, kCoverageGridSize - 1);
}

double coverage_percent(const std::vector<PositionSample>& samples) {
  constexpr int kCells = kCoverageGridSize * kCoverageGridSize;
  std::vector<bool> touched(kCells, false);
  int count = 0;
  for (const auto& s : samples) {
    if (!(s.x >= 0.0 && s.x <= 100.0 && s.y >= 0.0 && s.y <= 100.0)) continue;
    const int idx = reference_cell(s.y) * kCoverageGridSize + reference_cell(s.x);
    if (!touched[static_cast<std::size_t>(idx)]) {
      touched[static_cast<std::size_t>(idx)] = true;
      ++count;
    }
  }
  return static_cast<double>(count) / kCells * 100.0;
}

HeatStats compute_stats(const std::vector<PositionSample>& all_samples,
                        const std::vector<PositionSample>& window_samples) {
  HeatStats st;
  st.total_samples  = all_samples.size();
  st.window_samples = window_samples.size();
  if (all_samples.empty()) return st;

  double sum = 0.0;
  double mx  = 0.0;
  for (const auto& s : all_samples) {
    sum += s.intensity;
    mx = std::max(mx, s.intensity);
  }
  st.average_intensity = sum / static_cast<double>(all_samples.size());
  st.max_intensity     = mx;
  st.coverage_percent  = coverage_percent(all_samples);
  return st;
}

} // namespace pviz
