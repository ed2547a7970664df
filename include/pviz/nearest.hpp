#pragma once
#include <optional>
#include <vector>
#include <pviz/sample.hpp>

namespace pviz {

// Linear scans; ties resolve to the first occurrence in input order.
// Empty input yields nullopt: no sample is ever fabricated here.
std::optional<PositionSample> nearest_by_position(const std::vector<PositionSample>& samples,
                                                  double query_x,
                                                  double query_y);

std::optional<PositionSample> nearest_by_time(const std::vector<PositionSample>& samples,
                                              double query_time);

// Variants returning a caller-supplied fallback on empty input.
PositionSample nearest_by_position(const std::vector<PositionSample>& samples,
                                   double query_x,
                                   double query_y,
                                   const PositionSample& fallback);

PositionSample nearest_by_time(const std::vector<PositionSample>& samples,
                               double query_time,
                               const PositionSample& fallback);

} // namespace pviz
