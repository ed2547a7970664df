#include <pviz/formation.hpp>
#include <algorithm>
#include <cmath>
#include <pviz/log.hpp>
#include "csv_util.hpp"

namespace pviz {

static std::vector<FormationSlot> make_slots(FormationScheme scheme) {
  switch (scheme) {
    case FormationScheme::F442:
      return {
        {"GK", 50, 10},
        {"LB", 25, 35}, {"CB", 50, 35}, {"CB", 75, 35},
        {"LM", 25, 60}, {"CM", 50, 60}, {"CM", 75, 60},
        {"ST", 25, 85}, {"ST", 75, 85},
      };
    case FormationScheme::F433:
      return {
        {"GK", 50, 10},
        {"LB", 25, 35}, {"CB", 50, 35}, {"CB", 75, 35},
        {"CM", 25, 60}, {"CM", 50, 60}, {"CM", 75, 60},
        {"LW", 25, 85}, {"ST", 50, 85}, {"RW", 75, 85},
      };
    case FormationScheme::F352:
      return {
        {"GK", 50, 10},
        {"CB", 25, 35}, {"CB", 50, 35}, {"CB", 75, 35},
        {"LWB", 25, 60}, {"CM", 50, 60}, {"RWB", 75, 60},
        {"ST", 25, 85}, {"ST", 75, 85},
      };
    case FormationScheme::F4231:
      return {
        {"GK", 50, 10},
        {"LB", 25, 35}, {"CB", 50, 35}, {"CB", 75, 35},
        {"CDM", 25, 60}, {"CDM", 75, 60},
        {"LM", 25, 75}, {"CAM", 50, 75}, {"RM", 75, 75},
        {"ST", 50, 85},
      };
    case FormationScheme::Basketball122:
      return {
        {"PG", 50, 85},
        {"SG", 30, 75}, {"SF", 70, 75},
        {"PF", 30, 60}, {"C", 50, 50},
      };
    default:
      return make_slots(kDefaultScheme);
  }
}

const std::vector<FormationSlot>& scheme_slots(FormationScheme scheme) {
  static const std::vector<std::vector<FormationSlot>> table = []{
    std::vector<std::vector<FormationSlot>> t;
    for (int i = 0; i < static_cast<int>(FormationScheme::Count); ++i) {
      t.push_back(make_slots(static_cast<FormationScheme>(i)));
    }
    return t;
  }();
  const int idx = static_cast<int>(scheme);
  if (idx < 0 || idx >= static_cast<int>(table.size())) return table[static_cast<int>(kDefaultScheme)];
  return table[static_cast<std::size_t>(idx)];
}

const char* scheme_name(FormationScheme scheme) {
  switch (scheme) {
    case FormationScheme::F442:          return "4-4-2";
    case FormationScheme::F433:          return "4-3-3";
    case FormationScheme::F352:          return "3-5-2";
    case FormationScheme::F4231:         return "4-2-3-1";
    case FormationScheme::Basketball122: return "1-2-2";
    default: return "4-4-2";
  }
}

static std::string lower_trim(const std::string& s) {
  return csv::lower(csv::trim(s));
}

FormationScheme scheme_from_string(const std::string& name) {
  const auto key = lower_trim(name);
  for (int i = 0; i < static_cast<int>(FormationScheme::Count); ++i) {
    const auto s = static_cast<FormationScheme>(i);
    if (key == scheme_name(s)) return s;
  }
  log()->debug("unknown formation scheme '{}', using {}", name, scheme_name(kDefaultScheme));
  return kDefaultScheme;
}

std::vector<SlotAssignment> map_formation(FormationScheme scheme,
                                          const std::vector<TrackedEntity>& roster) {
  const auto& slots = scheme_slots(scheme);
  const std::size_t n = std::min(slots.size(), roster.size());
  std::vector<SlotAssignment> out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(SlotAssignment{&roster[i], slots[i], false});
  }
  return out;
}

double synthetic_jitter(double current_time, std::size_t entity_index) {
  return std::sin(current_time * 0.1 + static_cast<double>(entity_index)) * 3.0;
}

std::vector<SlotAssignment> synthesize_layout(FormationScheme scheme,
                                              const std::vector<TrackedEntity>& roster,
                                              double current_time) {
  auto out = map_formation(scheme, roster);
  for (std::size_t i = 0; i < out.size(); ++i) {
    const double v = synthetic_jitter(current_time, i);
    auto& slot = out[i].slot;
    slot.x = std::clamp(slot.x + v, 10.0, 90.0);
    slot.y = std::clamp(slot.y + v, 10.0, 90.0);
    out[i].synthetic = true;
  }
  return out;
}

static std::vector<FieldPoint> sorted_by_y(std::vector<FieldPoint> pts) {
  std::stable_sort(pts.begin(), pts.end(), [](const FieldPoint& a, const FieldPoint& b){ return a.y < b.y; });
  return pts;
}

std::string classify_formation(const std::vector<FieldPoint>& points) {
  const std::size_t n = points.size();
  const std::size_t d = std::min<std::size_t>(4, n);
  const std::size_t m = std::min<std::size_t>(4, n - d);
  const std::size_t a = n - d - m;
  return std::to_string(d) + "-" + std::to_string(m) + "-" + std::to_string(a);
}

std::string classify_formation(const std::vector<FieldPoint>& points, FormationScheme scheme) {
  if (scheme == FormationScheme::Basketball122) return kCourtSetupLabel;
  return classify_formation(points);
}

FormationLines formation_lines(const std::vector<FieldPoint>& points) {
  FormationLines lines;
  if (points.size() < 3) return lines;
  const auto sorted = sorted_by_y(points);
  const std::size_t n = sorted.size();

  const std::size_t d = std::min<std::size_t>(4, n);
  lines.defence.assign(sorted.begin(), sorted.begin() + static_cast<std::ptrdiff_t>(d));

  const auto lo = static_cast<std::size_t>(std::floor(static_cast<double>(n) * 0.3));
  const auto hi = static_cast<std::size_t>(std::floor(static_cast<double>(n) * 0.7));
  if (hi > lo) {
    lines.midfield.assign(sorted.begin() + static_cast<std::ptrdiff_t>(lo),
                          sorted.begin() + static_cast<std::ptrdiff_t>(hi));
  }
  return lines;
}

Sport sport_from_string(const std::string& name) {
  const auto key = lower_trim(name);
  if (key == "football")   return Sport::Football;
  if (key == "soccer")     return Sport::Soccer;
  if (key == "basketball") return Sport::Basketball;
  if (key == "rugby")      return Sport::Rugby;
  if (key == "volleyball") return Sport::Volleyball;
  if (key == "tennis")     return Sport::Tennis;
  if (key == "baseball")   return Sport::Baseball;
  if (key == "cricket")    return Sport::Cricket;
  return Sport::Unknown;
}

std::size_t expected_team_size(Sport sport) {
  switch (sport) {
    case Sport::Basketball: return 5;
    case Sport::Football:
    case Sport::Soccer:     return 11;
    case Sport::Rugby:      return 15;
    case Sport::Volleyball: return 6;
    case Sport::Tennis:     return 2;
    case Sport::Baseball:   return 9;
    case Sport::Cricket:    return 11;
    default:                return 11;
  }
}

static constexpr const char* kGeneratedPrefix = "generated_";

bool is_generated(const TrackedEntity& e) {
  return e.id.rfind(kGeneratedPrefix, 0) == 0;
}

std::vector<TrackedEntity> pad_roster(const std::vector<TrackedEntity>& roster,
                                      Sport sport,
                                      double current_time) {
  std::vector<TrackedEntity> out = roster;
  const std::size_t target = expected_team_size(sport);
  const auto& layout = scheme_slots(sport == Sport::Basketball ? FormationScheme::Basketball122
                                                               : FormationScheme::F442);
  for (std::size_t i = out.size(); i < target; ++i) {
    const FormationSlot& base = layout[i % layout.size()];
    const double v = synthetic_jitter(current_time, i);

    TrackedEntity e;
    e.id = kGeneratedPrefix + std::to_string(i);
    e.display_name = "Player " + std::to_string(i + 1);
    e.numeric_label = static_cast<int>(i + 1);
    e.role_label = base.role_label;
    e.samples.push_back(make_sample(std::clamp(base.x + v, 0.0, 100.0),
                                    std::clamp(base.y + v, 0.0, 100.0),
                                    current_time, 0.6));
    out.push_back(std::move(e));
  }
  if (out.size() > roster.size()) {
    log()->debug("padded roster with {} placeholder(s)", out.size() - roster.size());
  }
  return out;
}

bool FormationHistory::record(const FormationSnapshot& s) {
  if (!entries_.empty()) {
    const auto& last = entries_.back();
    const bool changed = last.label != s.label;
    const bool far     = std::fabs(last.time - s.time) > kMinGapSeconds;
    if (!changed && !far) return false;
  }
  entries_.push_back(s);
  while (entries_.size() > kMaxEntries) entries_.pop_front();
  return true;
}

int FormationHistory::index_at(double t) const {
  if (entries_.empty()) return -1;
  int idx = 0;
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    if (entries_[i].time <= t) idx = static_cast<int>(i);
  }
  return idx;
}

} // namespace pviz
