#pragma once
#include <optional>
#include <vector>
#include <pviz/sample.hpp>

namespace pviz {

struct TimeRange {
  double start{0.0};
  double end{0.0};
  double length() const { return end - start; }
};

// Earliest and latest sample time over a roster; nullopt when it has no samples.
std::optional<TimeRange> time_range(const std::vector<TrackedEntity>& roster);

// Host-side playback clock: advances by frame time x speed, clamped to a range.
// Reaching the end pauses playback.
class PlaybackClock {
public:
  explicit PlaybackClock(TimeRange range = {}) : range_(range), now_(range.start) {}

  void advance(double dt_sec);
  void seek(double t);
  void toggle_pause() { paused_ = !paused_; }
  void set_paused(bool p) { paused_ = p; }
  void set_speed(double s) { speed_ = s < 0.0 ? 0.0 : s; }
  void set_range(TimeRange r);

  double now() const { return now_; }
  double speed() const { return speed_; }
  bool paused() const { return paused_; }
  const TimeRange& range() const { return range_; }

private:
  TimeRange range_;
  double now_{0.0};
  double speed_{1.0};
  bool paused_{false};
};

} // namespace pviz
