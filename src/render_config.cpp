#include <pviz/render_config.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <pviz/log.hpp>
#include "csv_util.hpp"

namespace pviz {

RenderConfig sanitize(RenderConfig cfg) {
  if (cfg.trail_length < 1) cfg.trail_length = 1;
  if (!(cfg.window_seconds > 0.0) || !std::isfinite(cfg.window_seconds)) cfg.window_seconds = 30.0;
  if (std::isnan(cfg.opacity)) cfg.opacity = 0.7;
  cfg.opacity = std::clamp(cfg.opacity, 0.0, 1.0);
  if (cfg.cell_size_px < 1) cfg.cell_size_px = 1;
  if (cfg.selected_entity_id && cfg.selected_entity_id->empty()) cfg.selected_entity_id.reset();
  return cfg;
}

bool is_tagged(const RenderConfig& cfg, const std::string& entity_id) {
  return std::find(cfg.tagged_ids.begin(), cfg.tagged_ids.end(), entity_id) != cfg.tagged_ids.end();
}

const char* render_mode_name(RenderMode m) {
  return m == RenderMode::AllEntities ? "all" : "single";
}

static bool apply_key(RenderConfig& cfg, const std::string& key, const std::string& value) {
  bool ok = false;
  if (key == "mode") {
    const auto v = csv::lower(value);
    if (v == "all")    { cfg.mode = RenderMode::AllEntities;  return true; }
    if (v == "single") { cfg.mode = RenderMode::SingleEntity; return true; }
    return false;
  }
  if (key == "selected") {
    if (value.empty()) cfg.selected_entity_id.reset();
    else cfg.selected_entity_id = value;
    return true;
  }
  if (key == "trails") {
    const bool b = csv::to_bool_safe(value, ok);
    if (ok) cfg.trails_on = b;
    return ok;
  }
  if (key == "trail_length") {
    const int n = csv::to_int_safe(value, ok);
    if (!ok || n < 0) return false;
    cfg.trail_length = static_cast<std::size_t>(n);
    return true;
  }
  if (key == "window_seconds") {
    const double w = csv::to_double_safe(value, ok);
    if (!ok || !(w > 0.0)) return false;
    cfg.window_seconds = w;
    return true;
  }
  if (key == "heat_zones") {
    const bool b = csv::to_bool_safe(value, ok);
    if (ok) cfg.heat_zones_on = b;
    return ok;
  }
  if (key == "opacity") {
    const double o = csv::to_double_safe(value, ok);
    if (ok) cfg.opacity = o;
    return ok;
  }
  if (key == "formation") {
    cfg.formation_scheme = scheme_from_string(value);
    return true;
  }
  if (key == "cell_size") {
    const int n = csv::to_int_safe(value, ok);
    if (!ok || n < 1) return false;
    cfg.cell_size_px = n;
    return true;
  }
  if (key == "highlight_points") {
    const bool b = csv::to_bool_safe(value, ok);
    if (ok) cfg.highlight_points_on = b;
    return ok;
  }
  if (key == "tagged_only") {
    const bool b = csv::to_bool_safe(value, ok);
    if (ok) cfg.tagged_only = b;
    return ok;
  }
  if (key == "formation_lines") {
    const bool b = csv::to_bool_safe(value, ok);
    if (ok) cfg.formation_lines_on = b;
    return ok;
  }
  if (key == "player_names") {
    const bool b = csv::to_bool_safe(value, ok);
    if (ok) cfg.player_names_on = b;
    return ok;
  }
  if (key == "color_key") {
    const auto v = csv::lower(value);
    if (v == "order") { cfg.color_key = ColorKey::RenderOrder; return true; }
    if (v == "id")    { cfg.color_key = ColorKey::StableId;    return true; }
    return false;
  }
  return false;
}

RenderConfig render_config_from_csv_stream(std::istream& in, const RenderConfig& base) {
  RenderConfig cfg = base;
  std::string line;
  int line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::string raw = csv::trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    auto cols = csv::split_line(raw);
    if (cols.size() < 2) {
      log()->warn("render config line {}: expected key,value", line_no);
      continue;
    }
    const auto key = csv::lower(cols[0]);
    if (key == "key") continue;  // header row
    if (key == "tagged") {
      cfg.tagged_ids.clear();
      for (std::size_t i = 1; i < cols.size(); ++i) {
        if (!cols[i].empty() && !is_tagged(cfg, cols[i])) cfg.tagged_ids.push_back(cols[i]);
      }
      continue;
    }
    if (!apply_key(cfg, key, cols[1])) {
      log()->warn("render config line {}: skipped '{}' = '{}'", line_no, cols[0], cols[1]);
    }
  }
  return sanitize(cfg);
}

std::optional<RenderConfig> load_render_config_csv(const std::string& path, const RenderConfig& base) {
  std::ifstream f(path);
  if (!f) {
    log()->warn("cannot open render config '{}'", path);
    return std::nullopt;
  }
  return render_config_from_csv_stream(f, base);
}

} // namespace pviz
