#include <pviz/time_window.hpp>
#include <algorithm>

namespace pviz {

bool in_window(const PositionSample& s, double current_time, double window_seconds, WindowMode mode) {
  const double start = current_time - window_seconds;
  const double end   = (mode == WindowMode::Symmetric) ? current_time + window_seconds : current_time;
  return s.t >= start && s.t <= end;
}

std::vector<PositionSample> filter_window(const std::vector<PositionSample>& samples,
                                          double current_time,
                                          double window_seconds,
                                          WindowMode mode,
                                          WindowOrder order) {
  std::vector<PositionSample> out;
  for (const auto& s : samples) {
    if (in_window(s, current_time, window_seconds, mode)) out.push_back(s);
  }
  if (order == WindowOrder::ByTime) {
    std::stable_sort(out.begin(), out.end(),
                     [](const PositionSample& a, const PositionSample& b){ return a.t < b.t; });
  }
  return out;
}

std::size_t count_in_window(const std::vector<PositionSample>& samples,
                            double current_time,
                            double window_seconds,
                            WindowMode mode) {
  return static_cast<std::size_t>(std::count_if(samples.begin(), samples.end(), [&](const PositionSample& s){
    return in_window(s, current_time, window_seconds, mode);
  }));
}

} // namespace pviz
