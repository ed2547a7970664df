#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <pviz/color_ramp.hpp>
#include <pviz/heat_grid.hpp>
#include <pviz/render_config.hpp>
#include <pviz/sample.hpp>
#include <pviz/stats.hpp>
#include <pviz/surface.hpp>

namespace pviz {

// Heat zones: cells below this normalized value are not drawn.
inline constexpr double kHeatCellThreshold = 0.1;
// Window samples above this intensity get a highlight dot.
inline constexpr double kHighlightThreshold = 0.7;

// Field markings scaled to the surface: background, border, centre line,
// centre circle, and penalty boxes + goals (or three-point arcs for a court).
void draw_field(RenderSurface& s, bool court = false);

// Pixel -> field percentage for the given surface.
FieldPoint pixel_to_field(const RenderSurface& s, float px, float py);

// Marker radius for a sample intensity: 6 + 6*i, clamped to [6, 12].
float marker_radius(double intensity);

// "#<number>" when present, otherwise the first word of the display name.
std::string marker_label(const TrackedEntity& e);

// Per-draw orchestrator. Stateless between calls apart from its config and
// a scratch heat grid; one instance must not be drawn from two threads.
class RenderDriver {
public:
  explicit RenderDriver(RenderConfig cfg = {});

  const RenderConfig& config() const { return cfg_; }
  // Replaces the config (sanitized).
  void set_config(const RenderConfig& cfg);

  // Draws one frame of the heat map view and returns its statistics.
  HeatStats render(RenderSurface& surface,
                   const std::vector<TrackedEntity>& entities,
                   double current_time);

  // Draws the formation view for config().formation_scheme. Entities with
  // samples are drawn at their position nearest to current_time with a solid
  // ring; the rest use the synthetic layout with a translucent ring. Tagged
  // entities are pink and larger. tagged_only limits markers and lines to
  // tagged entities. Returns the classification of the whole roster.
  std::string render_formation(RenderSurface& surface,
                               const std::vector<TrackedEntity>& roster,
                               double current_time);

  // Entities drawn under the current mode (AllEntities: all; SingleEntity:
  // selected id, falling back to the first entity).
  std::vector<const TrackedEntity*> entities_in_scope(const std::vector<TrackedEntity>& entities) const;

  // Entity whose samples a click resolves against: the selected one, else the first.
  const TrackedEntity* focus_entity(const std::vector<TrackedEntity>& entities) const;

  // Timestamp of the focus entity's sample nearest to (x_pct, y_pct).
  std::optional<double> timestamp_at(const std::vector<TrackedEntity>& entities,
                                     double x_pct, double y_pct) const;

  // Resolves a click to a timestamp and hands it to seek. Returns true if seek was called.
  bool handle_click(const std::vector<TrackedEntity>& entities,
                    double x_pct, double y_pct,
                    const std::function<void(double)>& seek) const;

  Rgb entity_color(std::size_t index, const TrackedEntity& e) const;

  // Grid built by the last render(); empty when heat zones were off.
  const HeatGrid& last_grid() const { return scratch_; }

private:
  void draw_heat_zones_(RenderSurface& s, const std::vector<PositionSample>& window);
  void draw_highlights_(RenderSurface& s, const std::vector<PositionSample>& window) const;
  void draw_trails_(RenderSurface& s, const std::vector<const TrackedEntity*>& scope, double t) const;
  void draw_markers_(RenderSurface& s, const std::vector<const TrackedEntity*>& scope, double t) const;

  RenderConfig cfg_;
  HeatGrid scratch_{};
};

} // namespace pviz
