#pragma once
#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <pviz/formation.hpp>
#include <pviz/heat_grid.hpp>

namespace pviz {

enum class RenderMode {
  AllEntities,
  SingleEntity,
};

enum class ColorKey {
  RenderOrder,  // hue by position in the entity list
  StableId,     // hue by hash of the entity id
};

struct RenderConfig {
  RenderMode mode{RenderMode::SingleEntity};
  std::optional<std::string> selected_entity_id{};
  bool trails_on{true};
  std::size_t trail_length{10};
  double window_seconds{30.0};
  bool heat_zones_on{true};
  double opacity{0.7};
  FormationScheme formation_scheme{kDefaultScheme};
  int cell_size_px{kDefaultCellSize};
  bool highlight_points_on{true};
  ColorKey color_key{ColorKey::RenderOrder};
  // Formation view
  std::vector<std::string> tagged_ids{};  // host-marked entities, drawn emphasised
  bool tagged_only{false};
  bool formation_lines_on{true};
  bool player_names_on{true};
};

bool is_tagged(const RenderConfig& cfg, const std::string& entity_id);

// trail_length >= 1, window_seconds > 0 (finite), opacity in [0,1], cell_size >= 1.
RenderConfig sanitize(RenderConfig cfg);

const char* render_mode_name(RenderMode m);

// Stream-based key,value loader (test-friendly; no filesystem required).
// Starts from `base`; unknown keys and bad values are skipped with a warning.
// 'tagged' takes every remaining column as an entity id.
// '#' comments and blank lines are ignored. The result is sanitized.
RenderConfig render_config_from_csv_stream(std::istream& in, const RenderConfig& base = {});

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<RenderConfig> load_render_config_csv(const std::string& path,
                                                   const RenderConfig& base = {});

} // namespace pviz
