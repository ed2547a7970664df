#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include <pviz/viewer/app.hpp>
#include <pviz/color_ramp.hpp>
#include <pviz/log.hpp>
#include <pviz/nearest.hpp>
#include <pviz/surface.hpp>

namespace pviz {

// RenderSurface over the raylib immediate-mode API, offset to a screen rect.
class RaylibSurface : public RenderSurface {
public:
  RaylibSurface(int x, int y, int w, int h) : ox_(x), oy_(y), w_(w), h_(h) {}

  int width() const override { return w_; }
  int height() const override { return h_; }
  int origin_x() const { return ox_; }
  int origin_y() const { return oy_; }
  bool contains(Vector2 p) const {
    return p.x >= ox_ && p.y >= oy_ && p.x < ox_ + w_ && p.y < oy_ + h_;
  }

  void clear() override {
    DrawRectangle(ox_, oy_, w_, h_, Color{16, 24, 20, 255});
  }
  void set_fill_color(Rgba c) override { fill_ = to_color(c); }
  void set_stroke_color(Rgba c) override { stroke_ = to_color(c); }
  void set_line_width(float w) override { line_w_ = w; }

  void fill_rect(float x, float y, float w, float h) override {
    DrawRectangleRec(Rectangle{ox_ + x, oy_ + y, w, h}, fill_);
  }
  void stroke_rect(float x, float y, float w, float h) override {
    DrawRectangleLinesEx(Rectangle{ox_ + x, oy_ + y, w, h}, line_w_, stroke_);
  }
  void draw_line(float x0, float y0, float x1, float y1) override {
    DrawLineEx(at(x0, y0), at(x1, y1), line_w_, stroke_);
  }
  void stroke_arc(float cx, float cy, float r, float start_rad, float end_rad) override {
    DrawRing(at(cx, cy), std::max(0.0f, r - line_w_ * 0.5f), r + line_w_ * 0.5f,
             start_rad * RAD2DEG, end_rad * RAD2DEG, 48, stroke_);
  }
  void fill_circle(float cx, float cy, float r) override {
    DrawCircleV(at(cx, cy), r, fill_);
  }
  void stroke_circle(float cx, float cy, float r) override {
    DrawRing(at(cx, cy), std::max(0.0f, r - line_w_ * 0.5f), r + line_w_ * 0.5f,
             0.0f, 360.0f, 48, stroke_);
  }
  void stroke_polyline(const std::vector<Vec2f>& pts) override {
    for (std::size_t i = 1; i < pts.size(); ++i) {
      DrawLineEx(at(pts[i-1].x, pts[i-1].y), at(pts[i].x, pts[i].y), line_w_, stroke_);
    }
  }
  void draw_text(const std::string& text, float x, float y, TextStyle font) override {
    const int tw = MeasureText(text.c_str(), font.size_px);
    const int px = ox_ + static_cast<int>(x) - tw / 2;
    const int py = oy_ + static_cast<int>(y) - font.size_px;
    DrawText(text.c_str(), px, py, font.size_px, fill_);
    if (font.bold) DrawText(text.c_str(), px + 1, py, font.size_px, fill_);
  }

private:
  static Color to_color(Rgba c) {
    const double a = std::clamp(c.a, 0.0, 1.0);
    return Color{c.r, c.g, c.b, static_cast<unsigned char>(std::lround(a * 255.0))};
  }
  Vector2 at(float x, float y) const { return Vector2{ox_ + x, oy_ + y}; }

  int ox_{0}, oy_{0}, w_{0}, h_{0};
  Color fill_{0, 0, 0, 255};
  Color stroke_{0, 0, 0, 255};
  float line_w_{1.0f};
};

namespace {

static const char* speedLabel(const PlaybackClock& c) {
  if (c.paused())       return "Paused";
  if (c.speed() == 0.25) return "0.25x";
  if (c.speed() == 0.5)  return "0.5x";
  if (c.speed() == 1.0)  return "1x";
  if (c.speed() == 2.0)  return "2x";
  if (c.speed() == 4.0)  return "4x";
  return "custom";
}

static void fmt_clock(double s, char* out, int cap) {
  if (cap <= 0 || out == nullptr) return;
  if (s < 0.0 || !std::isfinite(s)) { std::snprintf(out, (size_t)cap, "%s", "--"); return; }
  const int minutes = (int)(s / 60.0);
  const double rem  = s - minutes * 60.0;
  std::snprintf(out, (size_t)cap, "%d:%04.1f", minutes, rem);
}

// Mean confidence of each roster entity's sample nearest to t.
static double mean_confidence_at(const std::vector<TrackedEntity>& roster, double t) {
  double sum = 0.0;
  int n = 0;
  for (const auto& e : roster) {
    if (auto s = nearest_by_time(e.samples, t)) { sum += s->confidence; ++n; }
  }
  return n > 0 ? sum / n : 0.0;
}

// --- HUD layout (keep in sync with draw_hud_) ---
static constexpr int kHUD_LINE1_Y = 20;  // size 20
static constexpr int kHUD_LINE2_Y = 46;  // size 18
static constexpr int kHUD_LINE3_Y = 72;  // size 14
static constexpr float kFieldAspect = 0.65f;  // width / height
static constexpr int kPanelWidth = 300;

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(std::vector<TrackedEntity> roster, RenderConfig cfg, std::string source_label)
  : roster_(std::move(roster)),
    driver_(std::move(cfg)),
    source_label_(std::move(source_label)) {
  if (auto r = time_range(roster_)) clock_.set_range(*r);
  clock_.seek(clock_.range().start);
}

int ViewerApp::run() {
  const int W = 1024, H = 800;
  SetConfigFlags(FLAG_WINDOW_RESIZABLE);
  InitWindow(W, H, "pitchviz - Viewer");
  SetTargetFPS(60);
  log()->info("viewer started: {} entities, t=[{:.1f}, {:.1f}]",
              roster_.size(), clock_.range().start, clock_.range().end);

  while (!WindowShouldClose()) {
    process_input_();
    clock_.advance(GetFrameTime());
    render_frame_();
  }

  CloseWindow();
  log()->info("viewer closed");
  return 0;
}

void ViewerApp::process_input_() {
  RenderConfig cfg = driver_.config();
  bool changed = false;

  // Playback
  if (IsKeyPressed(KEY_SPACE)) clock_.toggle_pause();
  if (IsKeyPressed(KEY_ONE))   clock_.set_speed(0.25);
  if (IsKeyPressed(KEY_TWO))   clock_.set_speed(0.5);
  if (IsKeyPressed(KEY_THREE)) clock_.set_speed(1.0);
  if (IsKeyPressed(KEY_FOUR))  clock_.set_speed(2.0);
  if (IsKeyPressed(KEY_FIVE))  clock_.set_speed(4.0);
  if (IsKeyPressed(KEY_LEFT))  clock_.seek(clock_.now() - 5.0);
  if (IsKeyPressed(KEY_RIGHT)) clock_.seek(clock_.now() + 5.0);
  if (IsKeyPressed(KEY_R))     { clock_.seek(clock_.range().start); history_.clear(); }

  // Display toggles
  if (IsKeyPressed(KEY_A)) {
    cfg.mode = cfg.mode == RenderMode::AllEntities ? RenderMode::SingleEntity : RenderMode::AllEntities;
    changed = true;
  }
  if (IsKeyPressed(KEY_T)) { cfg.trails_on = !cfg.trails_on; changed = true; }
  if (IsKeyPressed(KEY_H)) { cfg.heat_zones_on = !cfg.heat_zones_on; changed = true; }
  if (IsKeyPressed(KEY_P)) { cfg.highlight_points_on = !cfg.highlight_points_on; changed = true; }
  if (IsKeyPressed(KEY_C)) {
    cfg.color_key = cfg.color_key == ColorKey::RenderOrder ? ColorKey::StableId : ColorKey::RenderOrder;
    changed = true;
  }
  if (IsKeyPressed(KEY_LEFT_BRACKET))  { cfg.window_seconds = std::max(5.0, cfg.window_seconds - 5.0); changed = true; }
  if (IsKeyPressed(KEY_RIGHT_BRACKET)) { cfg.window_seconds += 5.0; changed = true; }
  if (IsKeyPressed(KEY_MINUS) && cfg.trail_length > 1) { cfg.trail_length -= 1; changed = true; }
  if (IsKeyPressed(KEY_EQUAL)) { cfg.trail_length = std::min<std::size_t>(50, cfg.trail_length + 1); changed = true; }
  if (IsKeyPressed(KEY_DOWN))  { cfg.opacity = std::max(0.0, cfg.opacity - 0.1); changed = true; }
  if (IsKeyPressed(KEY_UP))    { cfg.opacity = std::min(1.0, cfg.opacity + 0.1); changed = true; }

  // Formation view
  if (IsKeyPressed(KEY_F)) formation_view_ = !formation_view_;
  if (IsKeyPressed(KEY_G)) {
    int next = (static_cast<int>(cfg.formation_scheme) + 1) % static_cast<int>(FormationScheme::Count);
    cfg.formation_scheme = static_cast<FormationScheme>(next);
    history_.clear();
    changed = true;
  }
  if (IsKeyPressed(KEY_L)) { cfg.formation_lines_on = !cfg.formation_lines_on; changed = true; }
  if (IsKeyPressed(KEY_N)) { cfg.player_names_on = !cfg.player_names_on; changed = true; }
  if (IsKeyPressed(KEY_O)) { cfg.tagged_only = !cfg.tagged_only; changed = true; }
  if (IsKeyPressed(KEY_K)) {
    // Tag or untag the focus entity.
    if (const auto* e = driver_.focus_entity(roster_)) {
      auto it = std::find(cfg.tagged_ids.begin(), cfg.tagged_ids.end(), e->id);
      if (it == cfg.tagged_ids.end()) cfg.tagged_ids.push_back(e->id);
      else cfg.tagged_ids.erase(it);
      changed = true;
    }
  }

  if (changed) driver_.set_config(cfg);
  if (IsKeyPressed(KEY_TAB)) cycle_selection_();
}

void ViewerApp::cycle_selection_() {
  if (roster_.empty()) return;
  RenderConfig cfg = driver_.config();
  const auto* cur = driver_.focus_entity(roster_);
  std::size_t idx = cur ? static_cast<std::size_t>(cur - roster_.data()) : 0;
  idx = (idx + 1) % roster_.size();
  cfg.selected_entity_id = roster_[idx].id;
  driver_.set_config(cfg);
  log()->debug("selected entity {}", roster_[idx].id);
}

void ViewerApp::handle_mouse_(const RaylibSurface& field) {
  if (formation_view_) return;
  if (!IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) return;
  const Vector2 m = GetMousePosition();
  if (!field.contains(m)) return;
  const auto p = pixel_to_field(field, m.x - field.origin_x(), m.y - field.origin_y());
  driver_.handle_click(roster_, p.x, p.y, [this](double t){ clock_.seek(t); });
}

void ViewerApp::render_frame_() {
  const int field_h = std::max(60, GetScreenHeight() - field_y_ - 20);
  const int field_w = std::max(40, static_cast<int>(field_h * kFieldAspect));
  RaylibSurface field(field_x_, field_y_, field_w, field_h);

  handle_mouse_(field);

  BeginDrawing();
  ClearBackground(Color{18, 18, 22, 255});

  BeginScissorMode(field_x_, field_y_, field_w, field_h);
  if (formation_view_) {
    last_formation_ = driver_.render_formation(field, roster_, clock_.now());
    history_.record(FormationSnapshot{last_formation_, clock_.now(), mean_confidence_at(roster_, clock_.now())});
  } else {
    last_stats_ = driver_.render(field, roster_, clock_.now());
  }
  EndScissorMode();

  draw_hud_();
  draw_legend_(field_x_ + field_w + 20, field_y_);
  EndDrawing();
}

void ViewerApp::draw_hud_() {
  const auto& cfg = driver_.config();
  char now[32], end[32];
  fmt_clock(clock_.now(), now, sizeof(now));
  fmt_clock(clock_.range().end, end, sizeof(end));

  DrawText(TextFormat("%s  entities=%d  t=%s / %s  speed=%s  view=%s",
                      source_label_.c_str(),
                      (int)roster_.size(),
                      now, end,
                      speedLabel(clock_),
                      formation_view_ ? "formation" : "heat"),
           20, kHUD_LINE1_Y, 20, Color{220,235,220,255});

  const TrackedEntity* focus = driver_.focus_entity(roster_);
  DrawText(TextFormat("mode=%s  focus=%s  window=%.0fs  trail=%d  opacity=%d%%  scheme=%s",
                      render_mode_name(cfg.mode),
                      focus ? focus->display_name.c_str() : "-",
                      cfg.window_seconds,
                      (int)cfg.trail_length,
                      (int)std::lround(cfg.opacity * 100.0),
                      scheme_name(cfg.formation_scheme)),
           20, kHUD_LINE2_Y, 18, Color{235,220,220,255});

  DrawText("Space: Pause | 1..5: Speed | Left/Right: Seek | A: All/Single | Tab: Next | T: Trails | H: Heat | P: Points | [ ]: Window | -/=: Trail | Up/Down: Opacity | C: Colors | F: Formation | G: Scheme | K: Tag | O: Tagged only | L: Lines | N: Names | Click: Seek",
           20, kHUD_LINE3_Y, 14, Color{190,205,190,255});
}

void ViewerApp::draw_legend_(int x, int y) {
  const int pad = 8;
  const int box_h = 420;
  DrawRectangle(x - 6, y - 6, kPanelWidth + 12, box_h + 12, Color{0,0,0,80});
  DrawRectangle(x, y, kPanelWidth, box_h, Color{24,24,28,220});

  const Color hdr = Color{220,220,230,255};
  const Color txt = Color{200,200,210,255};
  int cy = y + pad;

  if (formation_view_) {
    DrawText(TextFormat("Formation %s", last_formation_.c_str()), x + pad, cy, 18, hdr);
    cy += 28;
    DrawText("History", x + pad, cy, 16, hdr);
    cy += 22;
    const auto& entries = history_.entries();
    const int cur = history_.index_at(clock_.now());
    for (int i = static_cast<int>(entries.size()) - 1; i >= 0 && cy < y + box_h - 20; --i) {
      char at[32];
      fmt_clock(entries[(size_t)i].time, at, sizeof(at));
      DrawText(TextFormat("%s  %s  %d%%", at, entries[(size_t)i].label.c_str(),
                          (int)std::lround(entries[(size_t)i].confidence * 100.0)),
               x + pad, cy, 16, i == cur ? Color{255,215,0,255} : txt);
      cy += 20;
    }
    return;
  }

  DrawText("Statistics", x + pad, cy, 18, hdr);
  cy += 26;
  DrawText(TextFormat("Total points     %d", (int)last_stats_.total_samples), x + pad, cy, 16, txt); cy += 20;
  DrawText(TextFormat("Window points    %d", (int)last_stats_.window_samples), x + pad, cy, 16, txt); cy += 20;
  DrawText(TextFormat("Avg intensity    %d%%", (int)std::lround(last_stats_.average_intensity * 100.0)), x + pad, cy, 16, txt); cy += 20;
  DrawText(TextFormat("Max intensity    %d%%", (int)std::lround(last_stats_.max_intensity * 100.0)), x + pad, cy, 16, txt); cy += 20;
  DrawText(TextFormat("Field coverage   %d%%", (int)std::lround(last_stats_.coverage_percent)), x + pad, cy, 16, txt); cy += 30;

  // Heat intensity ramp
  DrawText("Heat intensity", x + pad, cy, 16, hdr);
  cy += 22;
  const int ramp_w = kPanelWidth - pad * 2;
  for (int i = 0; i < ramp_w; ++i) {
    const Rgb c = color_ramp(static_cast<double>(i) / (ramp_w - 1));
    DrawLine(x + pad + i, cy, x + pad + i, cy + 14, Color{c.r, c.g, c.b, 255});
  }
  cy += 18;
  DrawText("Low", x + pad, cy, 12, txt);
  DrawText("High", x + pad + ramp_w - MeasureText("High", 12), cy, 12, txt);
  cy += 26;

  // Entities in scope with their palette swatch
  DrawText("Entities", x + pad, cy, 16, hdr);
  cy += 22;
  const auto scope = driver_.entities_in_scope(roster_);
  for (std::size_t i = 0; i < scope.size() && cy < y + box_h - 18; ++i) {
    const Rgb c = driver_.entity_color(i, *scope[i]);
    DrawRectangle(x + pad, cy + 2, 10, 10, Color{c.r, c.g, c.b, 255});
    DrawText(TextFormat("%s  %s", marker_label(*scope[i]).c_str(), scope[i]->display_name.c_str()),
             x + pad + 16, cy, 14, txt);
    cy += 18;
  }
}

} // namespace pviz
