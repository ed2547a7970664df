#include <pviz/nearest.hpp>
#include <cmath>
#include <cstddef>

namespace pviz {

// Index of the first minimum of metric(sample); samples must be non-empty.
template <class Metric>
static std::size_t argmin_first(const std::vector<PositionSample>& samples, Metric metric) {
  std::size_t best = 0;
  double best_d = metric(samples[0]);
  for (std::size_t i = 1; i < samples.size(); ++i) {
    const double d = metric(samples[i]);
    if (d < best_d) { best_d = d; best = i; }
  }
  return best;
}

std::optional<PositionSample> nearest_by_position(const std::vector<PositionSample>& samples,
                                                  double query_x,
                                                  double query_y) {
  if (samples.empty()) return std::nullopt;
  const auto i = argmin_first(samples, [&](const PositionSample& s){
    return std::hypot(s.x - query_x, s.y - query_y);
  });
  return samples[i];
}

std::optional<PositionSample> nearest_by_time(const std::vector<PositionSample>& samples,
                                              double query_time) {
  if (samples.empty()) return std::nullopt;
  const auto i = argmin_first(samples, [&](const PositionSample& s){
    return std::fabs(s.t - query_time);
  });
  return samples[i];
}

PositionSample nearest_by_position(const std::vector<PositionSample>& samples,
                                   double query_x,
                                   double query_y,
                                   const PositionSample& fallback) {
  return nearest_by_position(samples, query_x, query_y).value_or(fallback);
}

PositionSample nearest_by_time(const std::vector<PositionSample>& samples,
                               double query_time,
                               const PositionSample& fallback) {
  return nearest_by_time(samples, query_time).value_or(fallback);
}

} // namespace pviz
