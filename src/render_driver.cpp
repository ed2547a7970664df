#include <pviz/render_driver.hpp>
#include <algorithm>
#include <cmath>
#include <utility>
#include <pviz/formation.hpp>
#include <pviz/log.hpp>
#include <pviz/nearest.hpp>
#include <pviz/time_window.hpp>
#include <pviz/trail.hpp>

namespace pviz {

namespace {

constexpr float kPi = 3.14159265358979323846f;

const Rgba kFieldFill    {34, 197, 94, 0.1};
const Rgba kFieldStroke  {34, 197, 94, 0.3};
const Rgba kWhite        {255, 255, 255, 1.0};
const Rgba kHighlight    {255, 255, 255, 0.8};
const Rgba kDefenceLine  {59, 130, 246, 0.3};
const Rgba kMidfieldLine {34, 197, 94, 0.3};
const Rgba kTaggedFill   {236, 72, 153, 1.0};
const Rgba kUntaggedFill {107, 114, 128, 1.0};
const Rgba kSyntheticRing{255, 255, 255, 0.5};
const Rgba kMutedText    {156, 163, 175, 1.0};

Vec2f to_px(const RenderSurface& s, double x_pct, double y_pct) {
  return Vec2f{static_cast<float>(x_pct / 100.0 * s.width()),
               static_cast<float>(y_pct / 100.0 * s.height())};
}

std::vector<PositionSample> gather_samples(const std::vector<const TrackedEntity*>& scope) {
  std::vector<PositionSample> all;
  for (const auto* e : scope) all.insert(all.end(), e->samples.begin(), e->samples.end());
  return all;
}

void stroke_line_through(RenderSurface& s, const std::vector<FieldPoint>& pts, Rgba color) {
  if (pts.size() < 2) return;
  std::vector<Vec2f> px;
  px.reserve(pts.size());
  for (const auto& p : pts) px.push_back(to_px(s, p.x, p.y));
  s.set_stroke_color(color);
  s.set_line_width(2.0f);
  s.stroke_polyline(px);
}

} // namespace

void draw_field(RenderSurface& s, bool court) {
  const float w = static_cast<float>(s.width());
  const float h = static_cast<float>(s.height());

  s.set_fill_color(kFieldFill);
  s.fill_rect(0, 0, w, h);

  s.set_stroke_color(kFieldStroke);
  s.set_line_width(2.0f);
  s.stroke_rect(0, 0, w, h);
  s.draw_line(w / 2, 0, w / 2, h);
  s.stroke_circle(w / 2, h / 2, w * 0.08f);

  if (court) {
    s.stroke_arc(w / 2, h * 0.1f, w * 0.15f, 0.0f, kPi);
    s.stroke_arc(w / 2, h * 0.9f, w * 0.15f, kPi, 2.0f * kPi);
    return;
  }

  const float pen_w = w * 0.3f, pen_h = h * 0.15f;
  s.stroke_rect((w - pen_w) / 2, 0, pen_w, pen_h);
  s.stroke_rect((w - pen_w) / 2, h - pen_h, pen_w, pen_h);

  const float goal_w = w * 0.06f, goal_h = h * 0.08f;
  s.stroke_rect((w - goal_w) / 2, 0, goal_w, goal_h);
  s.stroke_rect((w - goal_w) / 2, h - goal_h, goal_w, goal_h);
}

FieldPoint pixel_to_field(const RenderSurface& s, float px, float py) {
  if (s.width() <= 0 || s.height() <= 0) return FieldPoint{};
  return FieldPoint{px / s.width() * 100.0, py / s.height() * 100.0};
}

float marker_radius(double intensity) {
  if (std::isnan(intensity)) intensity = 0.0;
  return static_cast<float>(std::clamp(6.0 + intensity * 6.0, 6.0, 12.0));
}

std::string marker_label(const TrackedEntity& e) {
  if (e.numeric_label) return "#" + std::to_string(*e.numeric_label);
  const auto end = e.display_name.find(' ');
  return e.display_name.substr(0, end);
}

// ---- RenderDriver ----

RenderDriver::RenderDriver(RenderConfig cfg) : cfg_(sanitize(std::move(cfg))) {}

void RenderDriver::set_config(const RenderConfig& cfg) {
  cfg_ = sanitize(cfg);
}

const TrackedEntity* RenderDriver::focus_entity(const std::vector<TrackedEntity>& entities) const {
  if (entities.empty()) return nullptr;
  if (cfg_.selected_entity_id) {
    if (const auto* e = find_entity(entities, *cfg_.selected_entity_id)) return e;
  }
  return &entities.front();
}

std::vector<const TrackedEntity*> RenderDriver::entities_in_scope(const std::vector<TrackedEntity>& entities) const {
  std::vector<const TrackedEntity*> out;
  if (cfg_.mode == RenderMode::AllEntities) {
    out.reserve(entities.size());
    for (const auto& e : entities) out.push_back(&e);
    return out;
  }
  if (const auto* e = focus_entity(entities)) out.push_back(e);
  return out;
}

Rgb RenderDriver::entity_color(std::size_t index, const TrackedEntity& e) const {
  if (cfg_.color_key == ColorKey::StableId) return entity_color_for_id(e.id);
  return pviz::entity_color(index);
}

HeatStats RenderDriver::render(RenderSurface& surface,
                               const std::vector<TrackedEntity>& entities,
                               double current_time) {
  surface.clear();
  draw_field(surface);

  const auto scope  = entities_in_scope(entities);
  const auto all    = gather_samples(scope);
  const auto window = filter_window(all, current_time, cfg_.window_seconds, WindowMode::Symmetric);

  if (cfg_.heat_zones_on) draw_heat_zones_(surface, window);
  else scratch_.reset(0, 0);
  if (cfg_.highlight_points_on) draw_highlights_(surface, window);
  if (cfg_.trails_on)           draw_trails_(surface, scope, current_time);
  draw_markers_(surface, scope, current_time);

  const auto stats = compute_stats(all, window);
  log()->debug("render t={:.2f} mode={} entities={} samples={} window={}",
               current_time, render_mode_name(cfg_.mode), scope.size(),
               stats.total_samples, stats.window_samples);
  return stats;
}

void RenderDriver::draw_heat_zones_(RenderSurface& s, const std::vector<PositionSample>& window) {
  const int cell = cfg_.cell_size_px;
  const auto dims = grid_dims_for_surface(s.width(), s.height(), cell);
  aggregate_into(scratch_, window, dims.width, dims.height);
  if (scratch_.empty() || scratch_.max_value <= 0.0) return;

  for (int row = 0; row < scratch_.height; ++row) {
    for (int col = 0; col < scratch_.width; ++col) {
      const double v = scratch_.at(row, col) / scratch_.max_value;
      if (v <= kHeatCellThreshold) continue;
      s.set_fill_color(with_alpha(color_ramp(v), cfg_.opacity * v));
      s.fill_rect(static_cast<float>(col * cell), static_cast<float>(row * cell),
                  static_cast<float>(cell), static_cast<float>(cell));
    }
  }
}

void RenderDriver::draw_highlights_(RenderSurface& s, const std::vector<PositionSample>& window) const {
  s.set_fill_color(kHighlight);
  for (const auto& p : window) {
    if (p.intensity <= kHighlightThreshold) continue;
    const auto px = to_px(s, p.x, p.y);
    s.fill_circle(px.x, px.y, 3.0f);
  }
}

void RenderDriver::draw_trails_(RenderSurface& s, const std::vector<const TrackedEntity*>& scope, double t) const {
  for (std::size_t i = 0; i < scope.size(); ++i) {
    const auto trail = build_trail(*scope[i], t, cfg_.window_seconds, cfg_.trail_length);
    if (trail.size() < 2) continue;

    std::vector<Vec2f> pts;
    pts.reserve(trail.size());
    for (const auto& p : trail) pts.push_back(to_px(s, p.x, p.y));

    s.set_stroke_color(with_alpha(entity_color(i, *scope[i]), kTrailAlpha));
    s.set_line_width(kTrailLineWidth);
    s.stroke_polyline(pts);
  }
}

void RenderDriver::draw_markers_(RenderSurface& s, const std::vector<const TrackedEntity*>& scope, double t) const {
  for (std::size_t i = 0; i < scope.size(); ++i) {
    const TrackedEntity& e = *scope[i];
    const auto at = nearest_by_time(e.samples, t);
    if (!at) continue;

    const auto c = to_px(s, at->x, at->y);
    const float r = marker_radius(at->intensity);

    s.set_fill_color(with_alpha(entity_color(i, e), 1.0));
    s.fill_circle(c.x, c.y, r);
    s.set_stroke_color(kWhite);
    s.set_line_width(2.0f);
    s.stroke_circle(c.x, c.y, r);

    s.set_fill_color(kWhite);
    s.draw_text(marker_label(e), c.x, c.y + 3.0f, TextStyle{10, true});
    if (!e.role_label.empty()) {
      s.draw_text(e.role_label, c.x, c.y + r + 12.0f, TextStyle{8, false});
    }
  }
}

std::string RenderDriver::render_formation(RenderSurface& surface,
                                           const std::vector<TrackedEntity>& roster,
                                           double current_time) {
  const auto scheme = cfg_.formation_scheme;
  surface.clear();
  draw_field(surface, scheme == FormationScheme::Basketball122);

  const auto assigned  = map_formation(scheme, roster);
  const auto synthetic = synthesize_layout(scheme, roster, current_time);

  std::vector<FieldPoint> points;
  std::vector<bool> measured;
  points.reserve(assigned.size());
  for (std::size_t i = 0; i < assigned.size(); ++i) {
    const auto at = nearest_by_time(assigned[i].entity->samples, current_time);
    if (at && !is_generated(*assigned[i].entity)) {
      points.push_back(FieldPoint{at->x, at->y});
      measured.push_back(true);
    } else {
      points.push_back(FieldPoint{synthetic[i].slot.x, synthetic[i].slot.y});
      measured.push_back(false);
    }
  }

  std::vector<std::size_t> shown;
  for (std::size_t i = 0; i < assigned.size(); ++i) {
    if (!cfg_.tagged_only || is_tagged(cfg_, assigned[i].entity->id)) shown.push_back(i);
  }

  if (cfg_.formation_lines_on) {
    std::vector<FieldPoint> shown_points;
    shown_points.reserve(shown.size());
    for (auto i : shown) shown_points.push_back(points[i]);
    const auto lines = formation_lines(shown_points);
    stroke_line_through(surface, lines.defence, kDefenceLine);
    stroke_line_through(surface, lines.midfield, kMidfieldLine);
  }

  for (auto i : shown) {
    const TrackedEntity& e = *assigned[i].entity;
    const bool tagged = is_tagged(cfg_, e.id);
    const auto c = to_px(surface, points[i].x, points[i].y);
    const float r = tagged ? 12.0f : 10.0f;

    surface.set_fill_color(tagged ? kTaggedFill : kUntaggedFill);
    surface.fill_circle(c.x, c.y, r);
    surface.set_stroke_color(measured[i] ? kWhite : kSyntheticRing);
    surface.set_line_width(2.0f);
    surface.stroke_circle(c.x, c.y, r);

    surface.set_fill_color(kWhite);
    const int number = e.numeric_label ? *e.numeric_label : static_cast<int>(i + 1);
    surface.draw_text(std::to_string(number), c.x, c.y + 3.0f, TextStyle{10, true});
    if (cfg_.player_names_on && !is_generated(e)) {
      surface.draw_text(e.display_name, c.x, c.y + r + 12.0f, TextStyle{8, false});
    }
    surface.set_fill_color(kMutedText);
    surface.draw_text(assigned[i].slot.role_label, c.x, c.y + r + 20.0f, TextStyle{7, false});
  }

  return classify_formation(points, scheme);
}

std::optional<double> RenderDriver::timestamp_at(const std::vector<TrackedEntity>& entities,
                                                 double x_pct, double y_pct) const {
  const auto* e = focus_entity(entities);
  if (!e) return std::nullopt;
  const auto hit = nearest_by_position(e->samples, x_pct, y_pct);
  if (!hit) return std::nullopt;
  return hit->t;
}

bool RenderDriver::handle_click(const std::vector<TrackedEntity>& entities,
                                double x_pct, double y_pct,
                                const std::function<void(double)>& seek) const {
  if (!seek) return false;
  const auto t = timestamp_at(entities, x_pct, y_pct);
  if (!t) {
    log()->debug("click ({:.1f}, {:.1f}) resolved to no sample", x_pct, y_pct);
    return false;
  }
  log()->info("seek to {:.2f}s from click ({:.1f}, {:.1f})", *t, x_pct, y_pct);
  seek(*t);
  return true;
}

} // namespace pviz
