#pragma once
#include <cstddef>
#include <vector>
#include <pviz/sample.hpp>

namespace pviz {

enum class WindowMode {
  Symmetric,  // [now - w, now + w]
  Trailing,   // [now - w, now], no look-ahead
};

enum class WindowOrder {
  Input,   // preserve input order
  ByTime,  // stable ascending by t
};

// Select samples whose timestamp falls inside the window (bounds inclusive).
std::vector<PositionSample> filter_window(const std::vector<PositionSample>& samples,
                                          double current_time,
                                          double window_seconds,
                                          WindowMode mode,
                                          WindowOrder order = WindowOrder::Input);

// Count without copying.
std::size_t count_in_window(const std::vector<PositionSample>& samples,
                            double current_time,
                            double window_seconds,
                            WindowMode mode);

bool in_window(const PositionSample& s, double current_time, double window_seconds, WindowMode mode);

} // namespace pviz
