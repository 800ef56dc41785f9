#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>
#include <random>
#include <vector>

#include <lapcmp/track_geom.hpp>

using Catch::Approx;
using namespace lapcmp;

static double mean(const std::vector<double>& v) {
  double s = 0.0;
  for (double a : v) s += a;
  return v.empty() ? 0.0 : s / double(v.size());
}

TEST_CASE("center_coordinates moves the centroid to the origin") {
  std::mt19937 rng(7);
  std::uniform_real_distribution<double> U(-5000.0, 5000.0);

  for (int trial = 0; trial < 20; ++trial) {
    std::vector<double> x, y;
    const double ox = U(rng), oy = U(rng);
    for (int i = 0; i < 50 + trial; ++i) { x.push_back(ox + U(rng) * 0.1); y.push_back(oy + U(rng) * 0.1); }

    std::vector<double> cx, cy;
    center_coordinates(x, y, cx, cy);
    REQUIRE(cx.size() == x.size());
    REQUIRE(std::fabs(mean(cx)) < 1e-9);
    REQUIRE(std::fabs(mean(cy)) < 1e-9);
  }
}

TEST_CASE("rotate_coordinates uses the standard counter-clockwise rotation") {
  std::vector<double> x{1.0, 0.0}, y{0.0, 2.0}, rx, ry;
  rotate_coordinates(x, y, kPI / 2.0, rx, ry);
  REQUIRE(rx[0] == Approx(0.0).margin(1e-12));
  REQUIRE(ry[0] == Approx(1.0));
  REQUIRE(rx[1] == Approx(-2.0));
  REQUIRE(ry[1] == Approx(0.0).margin(1e-12));
}

TEST_CASE("aspect_ratio is width over height") {
  SECTION("regular box") {
    REQUIRE(aspect_ratio({0.0, 20.0}, {0.0, 10.0}) == Approx(2.0));
  }
  SECTION("zero height is +inf, not an error") {
    const double r = aspect_ratio({0.0, 5.0, 9.0}, {3.0, 3.0, 3.0});
    REQUIRE(std::isinf(r));
    REQUIRE(r > 0.0);
  }
  SECTION("empty outline is 0") {
    REQUIRE(aspect_ratio({}, {}) == 0.0);
  }
}

TEST_CASE("optimize_orientation turns a tall rectangle on its side") {
  // 10 wide, 100 tall, centered
  std::vector<double> x{-5.0, 5.0, 5.0, -5.0};
  std::vector<double> y{-50.0, -50.0, 50.0, 50.0};

  const OrientedTrack t = optimize_orientation(x, y);
  REQUIRE(t.rotation_deg == 90);
  REQUIRE(t.aspect_ratio > 1.0);
  REQUIRE(t.aspect_ratio == Approx(10.0));
  REQUIRE(t.size() == 4);
}

TEST_CASE("optimize_orientation never does worse than no rotation") {
  std::mt19937 rng(2024);
  std::uniform_real_distribution<double> U(-1.0, 1.0);

  for (int trial = 0; trial < 25; ++trial) {
    std::vector<double> x, y;
    const double sx = 100.0 + 400.0 * std::fabs(U(rng));
    const double sy = 100.0 + 400.0 * std::fabs(U(rng));
    for (int i = 0; i < 40; ++i) { x.push_back(sx * U(rng) + 1e4); y.push_back(sy * U(rng) - 3e3); }

    std::vector<double> cx, cy;
    center_coordinates(x, y, cx, cy);
    const double at_zero = aspect_ratio(cx, cy);

    const OrientedTrack t = optimize_orientation(x, y);
    REQUIRE(t.aspect_ratio >= at_zero);
    REQUIRE(t.rotation_deg % kRotationStepDeg == 0);
    REQUIRE(t.rotation_deg >= 0);
    REQUIRE(t.rotation_deg < kRotationEndDeg);
    REQUIRE(std::fabs(mean(t.x)) < 1e-6);
    REQUIRE(std::fabs(mean(t.y)) < 1e-6);
  }
}

TEST_CASE("optimize_orientation keeps the first angle on ties") {
  // A square has the same ratio at every grid angle.
  std::vector<double> x{-1.0, 1.0, 1.0, -1.0};
  std::vector<double> y{-1.0, -1.0, 1.0, 1.0};
  const OrientedTrack t = optimize_orientation(x, y);
  REQUIRE(t.rotation_deg == 0);
  REQUIRE(t.aspect_ratio == Approx(1.0));
}

TEST_CASE("optimize_orientation handles degenerate outlines") {
  SECTION("empty") {
    const OrientedTrack t = optimize_orientation({}, {});
    REQUIRE(t.x.empty());
    REQUIRE(t.rotation_deg == 0);
    REQUIRE(t.aspect_ratio == 0.0);
  }
  SECTION("single point") {
    const OrientedTrack t = optimize_orientation({12.0}, {-4.0});
    REQUIRE(t.rotation_deg == 0);
    REQUIRE(std::isinf(t.aspect_ratio));
    REQUIRE(t.x[0] == Approx(0.0).margin(1e-12));
  }
  SECTION("horizontal line stays put") {
    const OrientedTrack t = optimize_orientation({0.0, 1.0, 2.0}, {5.0, 5.0, 5.0});
    REQUIRE(t.rotation_deg == 0);
    REQUIRE(std::isinf(t.aspect_ratio));
  }
}
