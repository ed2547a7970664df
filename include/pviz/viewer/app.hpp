#pragma once
#include <string>
#include <vector>
#include <pviz/formation.hpp>
#include <pviz/playback.hpp>
#include <pviz/render_driver.hpp>
#include <pviz/sample.hpp>
#include <pviz/stats.hpp>

namespace pviz {

class RaylibSurface;

// RAII application: plays back a roster and draws the heat map or formation
// view through RenderDriver, with a HUD and keyboard/mouse controls.
class ViewerApp {
public:
  ViewerApp(std::vector<TrackedEntity> roster, RenderConfig cfg, std::string source_label);
  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  void process_input_();
  void handle_mouse_(const RaylibSurface& field);
  void cycle_selection_();
  // Rendering
  void render_frame_();
  void draw_hud_();
  void draw_legend_(int x, int y);

  std::vector<TrackedEntity> roster_;
  RenderDriver driver_;
  PlaybackClock clock_;
  FormationHistory history_{};
  HeatStats last_stats_{};
  std::string source_label_;
  std::string last_formation_{};

  // UI state
  bool formation_view_{false};
  int field_x_{20};
  int field_y_{110};
};

} // namespace pviz
