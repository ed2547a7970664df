#include <pviz/trail.hpp>
#include <algorithm>
#include <iterator>
#include <pviz/time_window.hpp>

namespace pviz {

std::vector<PositionSample> build_trail(const TrackedEntity& entity,
                                        double current_time,
                                        double window_seconds,
                                        std::size_t trail_length) {
  auto recent = filter_window(entity.samples, current_time, window_seconds,
                              WindowMode::Trailing, WindowOrder::ByTime);
  const std::size_t keep = std::max<std::size_t>(trail_length, 1);
  if (recent.size() > keep) {
    recent.erase(recent.begin(), std::prev(recent.end(), static_cast<std::ptrdiff_t>(keep)));
  }
  return recent;
}

} // namespace pviz
