#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <pviz/sample.hpp>

namespace pviz {

// Stream-based tracking loader (test-friendly; no filesystem required).
// Rows: entity_id,display_name,number,role,x,y,t,confidence[,action]
// Accepts an optional header row (first column "entity_id"); ignores lines
// starting with '#' and blank lines. Whitespace around fields is trimmed.
// Invalid rows are skipped. x/y are clamped to [0,100], confidence to [0,1].
// Entities come back in first-seen order.
std::vector<TrackedEntity> tracking_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<std::vector<TrackedEntity>> load_tracking_csv(const std::string& path);

// Total sample count over a roster.
std::size_t total_samples(const std::vector<TrackedEntity>& roster);

} // namespace pviz
