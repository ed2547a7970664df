#include <catch2/catch_test_macros.hpp>
#include <vector>

#include <pviz/trail.hpp>

using namespace pviz;

static TrackedEntity runner() {
  TrackedEntity e;
  e.id = "p1";
  e.display_name = "Test Runner";
  // Unsorted times 0..20
  for (double t : {20.0, 3.0, 15.0, 0.0, 9.0, 12.0, 6.0, 18.0}) {
    e.samples.push_back(make_sample(t * 2.0, 50.0, t, 0.5));
  }
  return e;
}

TEST_CASE("build_trail is time-ordered and length bounded") {
  auto e = runner();
  auto trail = build_trail(e, 18.0, 100.0, 4);
  REQUIRE(trail.size() == 4);
  for (std::size_t i = 1; i < trail.size(); ++i) {
    REQUIRE(trail[i-1].t <= trail[i].t);
  }
  // The most recent samples up to now
  REQUIRE(trail.front().t == 9.0);
  REQUIRE(trail.back().t == 18.0);
}

TEST_CASE("build_trail never includes future samples") {
  auto e = runner();
  auto trail = build_trail(e, 10.0, 100.0, 50);
  REQUIRE(trail.size() == 4);  // 0, 3, 6, 9
  for (const auto& p : trail) REQUIRE(p.t <= 10.0);
}

TEST_CASE("build_trail length is min(trail_length, window count)") {
  auto e = runner();
  // Trailing window [10, 18] holds 12, 15, 18
  REQUIRE(build_trail(e, 18.0, 8.0, 10).size() == 3);
  REQUIRE(build_trail(e, 18.0, 8.0, 2).size() == 2);
}

TEST_CASE("build_trail treats zero length as one") {
  auto e = runner();
  auto trail = build_trail(e, 18.0, 100.0, 0);
  REQUIRE(trail.size() == 1);
  REQUIRE(trail[0].t == 18.0);
}

TEST_CASE("build_trail of an entity without samples is empty") {
  TrackedEntity e;
  e.id = "empty";
  REQUIRE(build_trail(e, 10.0, 30.0, 10).empty());
}
