#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <string>
#include <vector>

#include <lapcmp/compare.hpp>

#include "lap_fixtures.hpp"

using Catch::Approx;
using namespace lapcmp;
using lapcmp::testing::make_constant_lap;
using lapcmp::testing::make_ellipse_lap;

TEST_CASE("compare_drivers builds a complete comparison") {
  const auto ver = make_constant_lap("VER", 600, 220.0);
  const auto ham = make_constant_lap("HAM", 550, 200.0);

  Error err{};
  auto c = compare_drivers(ver, ham, "#0600EF", "#C0C0C0", CompareOptions{}, err);
  REQUIRE(c.has_value());

  const std::size_t n = kDefaultCheckpoints;
  REQUIRE(c->circuit.x.size() == n);
  REQUIRE(c->circuit.y.size() == n);
  REQUIRE(c->circuit.colors.size() == n);
  REQUIRE(c->delta.size() == n);
  REQUIRE(c->pilot1.size() == n);
  REQUIRE(c->pilot2.size() == n);

  REQUIRE(c->pilot1.name == "VER");
  REQUIRE(c->pilot2.name == "HAM");
  REQUIRE(c->pilot1.color == "#0600EF");
  REQUIRE(c->pilot2.color == "#C0C0C0");
  REQUIRE(c->pilot1.x == c->circuit.x);
  REQUIRE(c->pilot2.y == c->circuit.y);

  // VER is faster everywhere
  REQUIRE(c->delta.front() == 0.0);
  for (std::size_t i = 1; i < n; ++i) REQUIRE(c->delta[i] < c->delta[i - 1]);
  for (const auto& col : c->circuit.colors) REQUIRE(col == "#0600EF");

  // the 600 x 200 ellipse is already wider than tall
  REQUIRE(c->metadata.rotation_deg == 0);
  REQUIRE(c->metadata.aspect_ratio == Approx(3.0).epsilon(0.01));
}

TEST_CASE("compare_drivers honours the options") {
  const auto a = make_ellipse_lap("LEC", 400, 300.0, 100.0,
                                  [](std::size_t i){ return i < 200 ? 250.0 : 150.0; });
  const auto b = make_ellipse_lap("SAI", 400, 300.0, 100.0,
                                  [](std::size_t i){ return i < 200 ? 150.0 : 250.0; });
  CompareOptions opts{};
  opts.num_checkpoints = 200;
  opts.num_microsectors = 2;

  Error err{};
  auto c = compare_drivers(a, b, "red", "blue", opts, err);
  REQUIRE(c.has_value());
  REQUIRE(c->circuit.colors.size() == 200);
  REQUIRE(c->circuit.colors.front() == "red");
  REQUIRE(c->circuit.colors.back() == "blue");
}

TEST_CASE("compare_drivers looks colors up in the palette") {
  const auto nor = make_constant_lap("NOR", 100, 200.0);
  const auto zzz = make_constant_lap("ZZZ", 100, 190.0);
  Error err{};
  auto c = compare_drivers(nor, zzz, DriverPalette::builtin(), CompareOptions{}, err);
  REQUIRE(c.has_value());
  REQUIRE(c->pilot1.color == "#FF8700");
  REQUIRE(c->pilot2.color == kDefaultDriverColor);
}

TEST_CASE("compare_drivers names the driver that failed") {
  const auto good = make_constant_lap("VER", 100, 200.0);
  Error err{};

  SECTION("empty lap") {
    TelemetryLap empty{};
    empty.name = "PER";
    REQUIRE_FALSE(compare_drivers(good, empty, "a", "b", CompareOptions{}, err).has_value());
    REQUIRE(err.kind == ErrorKind::EmptyData);
    REQUIRE(err.driver == "PER");
  }
  SECTION("missing channel") {
    auto bad = good;
    bad.name = "BOT";
    bad.y.pop_back();
    REQUIRE_FALSE(compare_drivers(bad, good, "a", "b", CompareOptions{}, err).has_value());
    REQUIRE(err.kind == ErrorKind::MissingChannel);
    REQUIRE(err.driver == "BOT");
  }
  SECTION("bad options") {
    CompareOptions opts{};
    opts.num_microsectors = 0;
    REQUIRE_FALSE(compare_drivers(good, good, "a", "b", opts, err).has_value());
    REQUIRE(err.kind == ErrorKind::InvalidInput);

    opts = CompareOptions{};
    opts.num_checkpoints = 1;
    REQUIRE_FALSE(compare_drivers(good, good, "a", "b", opts, err).has_value());
    REQUIRE(err.kind == ErrorKind::InvalidInput);
  }
}
