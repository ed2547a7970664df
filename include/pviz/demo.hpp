#pragma once
#include <cstddef>
#include <vector>
#include <pviz/formation.hpp>
#include <pviz/sample.hpp>

namespace pviz {

struct DemoOptions {
  std::size_t entities{11};
  double duration_s{300.0};
  double rate_hz{2.0};
  FormationScheme scheme{kDefaultScheme};
};

// Deterministic roster for running the viewer without a tracking file: each
// entity circles its formation slot at its own radius and angular speed.
std::vector<TrackedEntity> make_demo_roster(const DemoOptions& opt = {});

} // namespace pviz
