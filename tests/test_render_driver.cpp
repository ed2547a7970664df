#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <string>
#include <vector>

#include <pviz/formation.hpp>
#include <pviz/render_driver.hpp>

using Catch::Approx;
using namespace pviz;

static TrackedEntity entity(const std::string& id, std::vector<PositionSample> samples) {
  TrackedEntity e;
  e.id = id;
  e.display_name = id + " Smith";
  e.role_label = "CM";
  e.samples = std::move(samples);
  return e;
}

static RenderConfig plain_config() {
  RenderConfig cfg;
  cfg.heat_zones_on = false;
  cfg.trails_on = false;
  cfg.highlight_points_on = false;
  return cfg;
}

TEST_CASE("render draws the field even without entities") {
  RenderDriver d;
  RecordingSurface s(300, 600);
  auto st = d.render(s, {}, 0.0);

  REQUIRE(s.commands().front().kind == DrawKind::Clear);
  REQUIRE(s.count(DrawKind::FillRect) == 1);      // background
  REQUIRE(s.count(DrawKind::StrokeRect) == 5);    // border, 2 boxes, 2 goals
  REQUIRE(s.count(DrawKind::Line) == 1);
  REQUIRE(s.count(DrawKind::StrokeCircle) == 1);
  REQUIRE(s.count(DrawKind::FillCircle) == 0);
  REQUIRE(st.total_samples == 0);

  const auto circle = s.of_kind(DrawKind::StrokeCircle)[0];
  REQUIRE(circle.r == Approx(300 * 0.08f));
  REQUIRE(circle.stroke == Rgba{34, 197, 94, 0.3});
}

TEST_CASE("single entity mode without selection draws the first entity") {
  std::vector<TrackedEntity> roster{
    entity("a", {make_sample(20, 20, 0, 0.5)}),
    entity("b", {make_sample(80, 80, 0, 0.5)}),
  };
  RenderDriver d(plain_config());
  REQUIRE(d.config().mode == RenderMode::SingleEntity);

  RecordingSurface s(200, 200);
  auto st = d.render(s, roster, 0.0);
  auto markers = s.of_kind(DrawKind::FillCircle);
  REQUIRE(markers.size() == 1);
  REQUIRE(markers[0].x == Approx(40.0f));
  REQUIRE(st.total_samples == 1);
}

TEST_CASE("unknown selection falls back to the first entity; known selection wins") {
  std::vector<TrackedEntity> roster{
    entity("a", {make_sample(20, 20, 0, 0.5)}),
    entity("b", {make_sample(80, 80, 0, 0.5)}),
  };
  auto cfg = plain_config();
  cfg.selected_entity_id = "nobody";
  RenderDriver d(cfg);
  REQUIRE(d.entities_in_scope(roster)[0]->id == "a");

  cfg.selected_entity_id = "b";
  d.set_config(cfg);
  REQUIRE(d.entities_in_scope(roster).size() == 1);
  REQUIRE(d.entities_in_scope(roster)[0]->id == "b");
}

TEST_CASE("all entities mode draws one marker per entity with samples") {
  std::vector<TrackedEntity> roster{
    entity("a", {make_sample(20, 20, 0, 0.5)}),
    entity("b", {make_sample(80, 80, 0, 1.0)}),
    entity("c", {}),
  };
  auto cfg = plain_config();
  cfg.mode = RenderMode::AllEntities;
  RenderDriver d(cfg);
  RecordingSurface s(100, 100);
  d.render(s, roster, 0.0);

  auto markers = s.of_kind(DrawKind::FillCircle);
  REQUIRE(markers.size() == 2);
  REQUIRE(markers[0].r == Approx(9.0f));
  REQUIRE(markers[1].r == Approx(12.0f));
  REQUIRE(markers[0].fill == with_alpha(entity_color(0), 1.0));
  REQUIRE(markers[1].fill == with_alpha(entity_color(1), 1.0));

  auto texts = s.of_kind(DrawKind::Text);
  REQUIRE(texts.size() == 4);
  REQUIRE(texts[0].text == "a");
  REQUIRE(texts[0].font.size_px == 10);
  REQUIRE(texts[1].text == "CM");
}

TEST_CASE("marker sits at the sample nearest the current time") {
  std::vector<TrackedEntity> roster{
    entity("a", {make_sample(10, 10, 0, 0.5), make_sample(50, 50, 10, 0.5), make_sample(90, 90, 20, 0.5)}),
  };
  RenderDriver d(plain_config());
  RecordingSurface s(100, 100);
  d.render(s, roster, 12.0);
  auto markers = s.of_kind(DrawKind::FillCircle);
  REQUIRE(markers.size() == 1);
  REQUIRE(markers[0].x == Approx(50.0f));
  REQUIRE(markers[0].y == Approx(50.0f));
}

TEST_CASE("heat zones fill one cell per hot grid cell") {
  std::vector<TrackedEntity> roster{
    entity("a", {make_sample(50, 50, 0, 0.5), make_sample(5, 5, 0, 0.04)}),
  };
  auto cfg = plain_config();
  cfg.heat_zones_on = true;
  RenderDriver d(cfg);
  RecordingSurface s(150, 150);
  d.render(s, roster, 0.0);

  auto rects = s.of_kind(DrawKind::FillRect);
  REQUIRE(rects.size() == 2);  // background + one hot cell, the cool one is below 0.1
  REQUIRE(rects[1].x == Approx(75.0f));
  REQUIRE(rects[1].y == Approx(75.0f));
  REQUIRE(rects[1].w == Approx(15.0f));
  REQUIRE(rects[1].fill == Rgba{255, 0, 0, 0.7});
  REQUIRE(d.last_grid().width == 10);
  REQUIRE(d.last_grid().height == 10);
}

TEST_CASE("heat zones use the symmetric window") {
  std::vector<TrackedEntity> roster{
    entity("a", {make_sample(50, 50, 100, 0.5)}),
  };
  auto cfg = plain_config();
  cfg.heat_zones_on = true;
  cfg.window_seconds = 10.0;
  RenderDriver d(cfg);
  RecordingSurface s(150, 150);

  auto st = d.render(s, roster, 95.0);  // sample is 5 s ahead
  REQUIRE(s.count(DrawKind::FillRect) == 2);
  REQUIRE(st.window_samples == 1);

  st = d.render(s, roster, 80.0);       // 20 s ahead, outside
  REQUIRE(s.count(DrawKind::FillRect) == 1);
  REQUIRE(st.window_samples == 0);
  REQUIRE(st.total_samples == 1);
}

TEST_CASE("heat grid follows the surface size on every draw") {
  std::vector<TrackedEntity> roster{entity("a", {make_sample(50, 50, 0, 0.5)})};
  auto cfg = plain_config();
  cfg.heat_zones_on = true;
  RenderDriver d(cfg);
  RecordingSurface s(150, 150);
  d.render(s, roster, 0.0);
  REQUIRE(d.last_grid().width == 10);

  s.resize(301, 150);
  d.render(s, roster, 0.0);
  REQUIRE(d.last_grid().width == 21);
  REQUIRE(d.last_grid().height == 10);
}

TEST_CASE("last_grid is emptied when heat zones are turned off") {
  std::vector<TrackedEntity> roster{entity("a", {make_sample(50, 50, 0, 0.8)})};
  RenderConfig cfg;
  RenderDriver d(cfg);
  RecordingSurface s(150, 150);
  d.render(s, roster, 0.0);
  REQUIRE(d.last_grid().total() == Approx(0.8));

  cfg.heat_zones_on = false;
  d.set_config(cfg);
  d.render(s, {}, 0.0);
  REQUIRE(d.last_grid().empty());
  REQUIRE(d.last_grid().total() == 0.0);
}

TEST_CASE("trails are stroked from the trailing window") {
  std::vector<PositionSample> path;
  for (int t = 0; t <= 10; ++t) path.push_back(make_sample(t * 5.0, 50.0, t, 0.5));
  std::vector<TrackedEntity> roster{entity("a", path)};

  auto cfg = plain_config();
  cfg.trails_on = true;
  cfg.trail_length = 5;
  RenderDriver d(cfg);
  RecordingSurface s(100, 100);
  d.render(s, roster, 8.0);

  auto lines = s.of_kind(DrawKind::Polyline);
  REQUIRE(lines.size() == 1);
  REQUIRE(lines[0].points.size() == 5);
  REQUIRE(lines[0].points.back().x == Approx(40.0f));  // t = 8, nothing later
  REQUIRE(lines[0].line_width == Approx(3.0f));
  REQUIRE(lines[0].stroke.a == Approx(0.6));
}

TEST_CASE("a single point trail is not stroked") {
  std::vector<TrackedEntity> roster{entity("a", {make_sample(10, 10, 0, 0.5)})};
  auto cfg = plain_config();
  cfg.trails_on = true;
  RenderDriver d(cfg);
  RecordingSurface s(100, 100);
  d.render(s, roster, 0.0);
  REQUIRE(s.count(DrawKind::Polyline) == 0);
}

TEST_CASE("highlight dots mark high intensity window samples") {
  std::vector<TrackedEntity> roster{
    entity("a", {make_sample(10, 10, 0, 0.9), make_sample(20, 20, 1, 0.3), make_sample(30, 30, 2, 0.75)}),
  };
  auto cfg = plain_config();
  cfg.highlight_points_on = true;
  RenderDriver d(cfg);
  RecordingSurface s(100, 100);
  d.render(s, roster, 1.0);

  int dots = 0;
  for (const auto& c : s.of_kind(DrawKind::FillCircle)) {
    if (c.r == 3.0f) {
      ++dots;
      REQUIRE(c.fill == Rgba{255, 255, 255, 0.8});
    }
  }
  REQUIRE(dots == 2);
}

TEST_CASE("stable id coloring ignores render order") {
  std::vector<TrackedEntity> roster{
    entity("a", {make_sample(20, 20, 0, 0.5)}),
    entity("b", {make_sample(80, 80, 0, 0.5)}),
  };
  auto cfg = plain_config();
  cfg.mode = RenderMode::AllEntities;
  cfg.color_key = ColorKey::StableId;
  RenderDriver d(cfg);
  REQUIRE(d.entity_color(0, roster[1]) == entity_color_for_id("b"));
  REQUIRE(d.entity_color(5, roster[1]) == d.entity_color(1, roster[1]));
}

TEST_CASE("click resolves to the nearest sample timestamp of the focus entity") {
  std::vector<TrackedEntity> roster{
    entity("a", {make_sample(10, 10, 0, 0.5), make_sample(80, 80, 5, 0.5)}),
    entity("b", {make_sample(12, 11, 42, 0.5)}),
  };
  RenderDriver d(plain_config());

  double seeked = -1.0;
  REQUIRE(d.handle_click(roster, 12.0, 11.0, [&](double t){ seeked = t; }));
  REQUIRE(seeked == Approx(0.0));

  auto cfg = plain_config();
  cfg.selected_entity_id = "b";
  d.set_config(cfg);
  const auto t = d.timestamp_at(roster, 70.0, 70.0);
  REQUIRE(t.has_value());
  REQUIRE(*t == Approx(42.0));
}

TEST_CASE("click on an entity without samples does not seek") {
  std::vector<TrackedEntity> roster{entity("a", {})};
  RenderDriver d(plain_config());
  bool called = false;
  REQUIRE_FALSE(d.handle_click(roster, 50.0, 50.0, [&](double){ called = true; }));
  REQUIRE_FALSE(called);
  REQUIRE_FALSE(d.timestamp_at({}, 50.0, 50.0).has_value());
}

TEST_CASE("pixel_to_field normalizes to percentages") {
  RecordingSurface s(400, 200);
  auto p = pixel_to_field(s, 100.0f, 150.0f);
  REQUIRE(p.x == Approx(25.0));
  REQUIRE(p.y == Approx(75.0));
}

TEST_CASE("marker helpers") {
  REQUIRE(marker_radius(0.0) == Approx(6.0f));
  REQUIRE(marker_radius(0.5) == Approx(9.0f));
  REQUIRE(marker_radius(3.0) == Approx(12.0f));

  TrackedEntity e;
  e.display_name = "Jamie Lee Carter";
  REQUIRE(marker_label(e) == "Jamie");
  e.numeric_label = 7;
  REQUIRE(marker_label(e) == "#7");
}

TEST_CASE("config is sanitized on construction") {
  RenderConfig cfg;
  cfg.trail_length = 0;
  cfg.window_seconds = -4.0;
  cfg.opacity = 1.7;
  cfg.cell_size_px = 0;
  RenderDriver d(cfg);
  REQUIRE(d.config().trail_length == 1);
  REQUIRE(d.config().window_seconds > 0.0);
  REQUIRE(d.config().opacity == Approx(1.0));
  REQUIRE(d.config().cell_size_px == 1);
}

static std::vector<TrackedEntity> f442_roster() {
  std::vector<TrackedEntity> roster;
  const auto& slots = scheme_slots(FormationScheme::F442);
  for (std::size_t i = 0; i < slots.size(); ++i) {
    roster.push_back(entity("p" + std::to_string(i), {make_sample(slots[i].x, slots[i].y, 0, 0.8)}));
  }
  return roster;
}

TEST_CASE("render_formation rings measured slots solid and synthetic slots faint") {
  auto roster = f442_roster();
  roster[8].samples.clear();  // last striker falls back to the synthetic layout

  RenderDriver d(plain_config());
  RecordingSurface s(300, 450);
  const auto label = d.render_formation(s, roster, 0.0);
  REQUIRE(label == "4-4-1");

  auto markers = s.of_kind(DrawKind::FillCircle);
  REQUIRE(markers.size() == 9);
  for (const auto& m : markers) {
    REQUIRE(m.r == Approx(10.0f));
    REQUIRE(m.fill == Rgba{107, 114, 128, 1.0});
  }
  auto rings = s.of_kind(DrawKind::StrokeCircle);
  REQUIRE(rings.size() == 10);  // centre circle + one per marker
  REQUIRE(rings[1].stroke == Rgba{255, 255, 255, 1.0});
  REQUIRE(rings[9].stroke == Rgba{255, 255, 255, 0.5});
  REQUIRE(s.count(DrawKind::Polyline) == 2);  // defence and midfield lines
}

TEST_CASE("render_formation draws tagged entities pink and larger") {
  auto roster = f442_roster();
  auto cfg = plain_config();
  cfg.tagged_ids = {"p0", "p5"};
  RenderDriver d(cfg);
  RecordingSurface s(300, 450);
  d.render_formation(s, roster, 0.0);

  auto markers = s.of_kind(DrawKind::FillCircle);
  REQUIRE(markers.size() == 9);
  REQUIRE(markers[0].r == Approx(12.0f));
  REQUIRE(markers[0].fill == Rgba{236, 72, 153, 1.0});
  REQUIRE(markers[5].r == Approx(12.0f));
  REQUIRE(markers[1].r == Approx(10.0f));
  REQUIRE(markers[1].fill == Rgba{107, 114, 128, 1.0});
}

TEST_CASE("render_formation tagged_only draws only tagged entities") {
  auto roster = f442_roster();
  auto cfg = plain_config();
  cfg.tagged_ids = {"p1", "p2"};
  cfg.tagged_only = true;
  RenderDriver d(cfg);
  RecordingSurface s(300, 450);
  const auto label = d.render_formation(s, roster, 0.0);

  REQUIRE(s.count(DrawKind::FillCircle) == 2);
  REQUIRE(s.count(DrawKind::Polyline) == 0);  // fewer than 3 points, no lines
  REQUIRE(label == "4-4-1");                  // label still covers the whole roster
}

TEST_CASE("render_formation toggles lines and names") {
  auto roster = f442_roster();
  auto cfg = plain_config();
  cfg.formation_lines_on = false;
  cfg.player_names_on = false;
  RenderDriver d(cfg);
  RecordingSurface s(300, 450);
  d.render_formation(s, roster, 0.0);

  REQUIRE(s.count(DrawKind::Polyline) == 0);
  for (const auto& t : s.of_kind(DrawKind::Text)) {
    REQUIRE(t.text.find("Smith") == std::string::npos);
  }

  cfg.player_names_on = true;
  d.set_config(cfg);
  d.render_formation(s, roster, 0.0);
  bool named = false;
  for (const auto& t : s.of_kind(DrawKind::Text)) {
    if (t.text == "p3 Smith") named = true;
  }
  REQUIRE(named);
}

TEST_CASE("render_formation labels the basketball scheme as a court setup") {
  std::vector<TrackedEntity> roster;
  for (const auto& slot : scheme_slots(FormationScheme::Basketball122)) {
    roster.push_back(entity(slot.role_label, {make_sample(slot.x, slot.y, 0, 0.5)}));
  }
  auto cfg = plain_config();
  cfg.formation_scheme = FormationScheme::Basketball122;
  RenderDriver d(cfg);
  RecordingSurface s(300, 450);
  REQUIRE(d.render_formation(s, roster, 0.0) == "5-Player Setup");
}

TEST_CASE("render_formation draws a court for the basketball scheme") {
  auto cfg = plain_config();
  cfg.formation_scheme = FormationScheme::Basketball122;
  RenderDriver d(cfg);
  RecordingSurface s(300, 450);
  d.render_formation(s, {}, 0.0);
  REQUIRE(s.count(DrawKind::Arc) == 2);
  REQUIRE(s.count(DrawKind::StrokeRect) == 1);
}
