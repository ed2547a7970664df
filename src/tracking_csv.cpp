#include <pviz/tracking_csv.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <unordered_map>
#include <pviz/log.hpp>
#include "csv_util.hpp"

namespace pviz {

namespace {

struct Row {
  std::string id;
  std::string name;
  std::optional<int> number;
  std::string role;
  PositionSample sample;
};

bool is_header_row(const std::vector<std::string>& cols) {
  return !cols.empty() && csv::lower(cols[0]) == "entity_id";
}

std::optional<Row> parse_row(const std::vector<std::string>& cols) {
  if (cols.size() < 8) return std::nullopt;
  Row r;
  r.id = cols[0];
  if (r.id.empty()) return std::nullopt;
  r.name = cols[1];
  r.role = cols[3];

  if (!cols[2].empty()) {
    bool ok = false;
    const int n = csv::to_int_safe(cols[2], ok);
    if (!ok) return std::nullopt;
    r.number = n;
  }

  bool ok1, ok2, ok3, ok4;
  double x    = csv::to_double_safe(cols[4], ok1);
  double y    = csv::to_double_safe(cols[5], ok2);
  double t    = csv::to_double_safe(cols[6], ok3);
  double conf = csv::to_double_safe(cols[7], ok4);
  if (!(ok1 && ok2 && ok3 && ok4)) return std::nullopt;
  if (!std::isfinite(x) || !std::isfinite(y) || !std::isfinite(t) || !std::isfinite(conf)) return std::nullopt;

  r.sample = make_sample(std::clamp(x, 0.0, 100.0),
                         std::clamp(y, 0.0, 100.0),
                         t,
                         std::clamp(conf, 0.0, 1.0));
  if (cols.size() > 8 && !cols[8].empty()) r.sample.action_tag = cols[8];
  return r;
}

} // namespace

std::vector<TrackedEntity> tracking_from_csv_stream(std::istream& in) {
  std::vector<TrackedEntity> out;
  std::unordered_map<std::string, std::size_t> index;
  std::string line;
  bool header_consumed = false;
  int line_no = 0;
  int skipped = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::string raw = csv::trim(line);
    if (raw.empty()) continue;
    if (raw[0] == '#') continue;

    auto cols = csv::split_line(raw);

    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }

    auto row = parse_row(cols);
    if (!row) {
      log()->warn("tracking line {}: skipped invalid row", line_no);
      ++skipped;
      continue;
    }

    auto it = index.find(row->id);
    if (it == index.end()) {
      TrackedEntity e;
      e.id = row->id;
      e.display_name = row->name;
      e.numeric_label = row->number;
      e.role_label = row->role;
      it = index.emplace(row->id, out.size()).first;
      out.push_back(std::move(e));
    }
    out[it->second].samples.push_back(std::move(row->sample));
  }

  log()->debug("loaded {} entities, {} samples ({} rows skipped)",
               out.size(), total_samples(out), skipped);
  return out;
}

std::optional<std::vector<TrackedEntity>> load_tracking_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    log()->warn("cannot open tracking file '{}'", path);
    return std::nullopt;
  }
  return tracking_from_csv_stream(f);
}

std::size_t total_samples(const std::vector<TrackedEntity>& roster) {
  std::size_t n = 0;
  for (const auto& e : roster) n += e.samples.size();
  return n;
}

} // namespace pviz
