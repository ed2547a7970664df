#pragma once
#include <cstddef>
#include <deque>
#include <string>
#include <vector>
#include <pviz/sample.hpp>

namespace pviz {

enum class FormationScheme : int {
  F442 = 0,
  F433,
  F352,
  F4231,
  Basketball122,
  Count
};

inline constexpr FormationScheme kDefaultScheme = FormationScheme::F442;

struct FormationSlot {
  std::string role_label;
  double x{};   // [0, 100]
  double y{};   // [0, 100]
};

struct SlotAssignment {
  const TrackedEntity* entity{nullptr};  // non-owning, points into the roster
  FormationSlot slot;
  bool synthetic{false};                 // presentation-only, not measured
};

// Canonical ordered slots for a scheme (goalkeeper/point guard first).
const std::vector<FormationSlot>& scheme_slots(FormationScheme scheme);

const char* scheme_name(FormationScheme scheme);

// "4-4-2", "4-3-3", "3-5-2", "4-2-3-1", "1-2-2". Unknown or empty -> 4-4-2.
FormationScheme scheme_from_string(const std::string& name);

// i-th roster entity to i-th slot, positionally (role labels are ignored).
// Short roster: trailing slots stay unassigned. Long roster: extras dropped.
std::vector<SlotAssignment> map_formation(FormationScheme scheme,
                                          const std::vector<TrackedEntity>& roster);

// Presentation-only layout for when no measured formation exists: base slots
// perturbed by sin(t*0.1 + i)*3 and clamped to [10, 90]. Tagged synthetic.
std::vector<SlotAssignment> synthesize_layout(FormationScheme scheme,
                                              const std::vector<TrackedEntity>& roster,
                                              double current_time);

double synthetic_jitter(double current_time, std::size_t entity_index);

struct FieldPoint {
  double x{};
  double y{};
};

// Bands points by y: first 4 defence, next 4 midfield, rest attack -> "d-m-a".
std::string classify_formation(const std::vector<FieldPoint>& points);

inline constexpr const char* kCourtSetupLabel = "5-Player Setup";

// As above for field schemes; the court scheme always reports kCourtSetupLabel.
std::string classify_formation(const std::vector<FieldPoint>& points, FormationScheme scheme);

struct FormationLines {
  std::vector<FieldPoint> defence;   // first min(4, n) by y
  std::vector<FieldPoint> midfield;  // [30%, 70%) by y
};

// Empty when fewer than 3 points.
FormationLines formation_lines(const std::vector<FieldPoint>& points);

// ---- Team padding ----

enum class Sport : int {
  Football = 0,
  Soccer,
  Basketball,
  Rugby,
  Volleyball,
  Tennis,
  Baseball,
  Cricket,
  Unknown
};

Sport sport_from_string(const std::string& name);
std::size_t expected_team_size(Sport sport);

// Appends synthetic placeholder entities ("generated_<i>") until the expected
// team size is reached. Placeholders carry one sample at a jittered default
// slot with confidence 0.6. Deterministic.
std::vector<TrackedEntity> pad_roster(const std::vector<TrackedEntity>& roster,
                                      Sport sport,
                                      double current_time);

bool is_generated(const TrackedEntity& e);

// ---- History ----

struct FormationSnapshot {
  std::string label;
  double time{};
  double confidence{};
};

// Keeps formation changes: a snapshot is recorded when the history is empty,
// the label changed, or more than kMinGapSeconds passed since the last entry.
class FormationHistory {
public:
  static constexpr std::size_t kMaxEntries = 20;
  static constexpr double kMinGapSeconds = 30.0;

  // Returns true when the snapshot was recorded.
  bool record(const FormationSnapshot& s);

  const std::deque<FormationSnapshot>& entries() const { return entries_; }
  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  void clear() { entries_.clear(); }

  // Index of the last entry with time <= t (entry 0 if t precedes all); -1 if empty.
  int index_at(double t) const;

private:
  std::deque<FormationSnapshot> entries_;
};

} // namespace pviz
