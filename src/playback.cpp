#include <pviz/playback.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace pviz {

std::optional<TimeRange> time_range(const std::vector<TrackedEntity>& roster) {
  std::optional<TimeRange> out;
  for (const auto& e : roster) {
    for (const auto& s : e.samples) {
      if (!std::isfinite(s.t)) continue;
      if (!out) { out = TimeRange{s.t, s.t}; continue; }
      out->start = std::min(out->start, s.t);
      out->end   = std::max(out->end, s.t);
    }
  }
  return out;
}

void PlaybackClock::advance(double dt_sec) {
  if (paused_ || dt_sec <= 0.0) return;
  now_ += dt_sec * speed_;
  if (now_ >= range_.end) {
    now_ = range_.end;
    paused_ = true;
  }
}

void PlaybackClock::seek(double t) {
  if (!std::isfinite(t)) return;
  now_ = std::clamp(t, range_.start, std::max(range_.start, range_.end));
}

void PlaybackClock::set_range(TimeRange r) {
  if (r.end < r.start) std::swap(r.start, r.end);
  range_ = r;
  seek(now_);
}

} // namespace pviz
