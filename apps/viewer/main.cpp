#include <cstring>
#include <string>
#include <pviz/demo.hpp>
#include <pviz/log.hpp>
#include <pviz/render_config.hpp>
#include <pviz/tracking_csv.hpp>
#include <pviz/viewer/app.hpp>

using namespace pviz;

static void print_usage(const char* argv0) {
  pviz::log()->info("usage: {} [tracking.csv] [--config render.csv] [--sport name] [--verbose]", argv0);
}

int main(int argc, char** argv) {
  std::string tracking_path;
  std::string config_path;
  std::string sport_name;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) config_path = argv[++i];
    else if (std::strcmp(argv[i], "--sport") == 0 && i + 1 < argc) sport_name = argv[++i];
    else if (std::strcmp(argv[i], "--verbose") == 0) set_log_level(spdlog::level::debug);
    else if (std::strcmp(argv[i], "--help") == 0) { print_usage(argv[0]); return 0; }
    else tracking_path = argv[i];
  }

  RenderConfig cfg;
  if (!config_path.empty()) {
    if (auto loaded = load_render_config_csv(config_path)) cfg = *loaded;
    else return 1;
  }

  std::vector<TrackedEntity> roster;
  std::string label = "demo";
  if (!tracking_path.empty()) {
    auto loaded = load_tracking_csv(tracking_path);
    if (!loaded) return 1;
    roster = std::move(*loaded);
    label = tracking_path;
  } else {
    DemoOptions opt;
    opt.scheme = cfg.formation_scheme;
    roster = make_demo_roster(opt);
  }

  if (!sport_name.empty()) {
    const Sport sport = sport_from_string(sport_name);
    const auto range = time_range(roster);
    roster = pad_roster(roster, sport, range ? range->start : 0.0);
  }

  pviz::log()->info("{}: {} entities, {} samples", label, roster.size(), total_samples(roster));

  ViewerApp app(std::move(roster), cfg, label);
  return app.run();
}
