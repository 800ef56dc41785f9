#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include <string>
#include <vector>

#include <lapcmp/compare.hpp>
#include <lapcmp/log.hpp>
#include <lapcmp/telemetry_csv.hpp>

#include "lap_fixtures.hpp"

using namespace lapcmp;
using lapcmp::testing::make_constant_lap;
using lapcmp::testing::make_ellipse_lap;

static TelemetryLap fast_in_third(const std::string& name, std::size_t third) {
  return make_ellipse_lap(name, 300, 300.0, 100.0,
                          [third](std::size_t i){ return i / 100 == third ? 300.0 : 100.0; });
}

TEST_CASE("circuit_dominance colors each segment by the sector winner") {
  const std::vector<TelemetryLap> laps{fast_in_third("VER", 0), fast_in_third("LEC", 1),
                                       fast_in_third("NOR", 2)};
  CompareOptions opts{};
  opts.num_microsectors = 3;

  Error err{};
  auto d = circuit_dominance(laps, {}, opts, err);
  REQUIRE(d.has_value());
  REQUIRE(d->x.size() == 300);
  REQUIRE(d->y.size() == 300);
  REQUIRE(d->colors.size() == 299);

  REQUIRE(d->drivers.size() == 3);
  REQUIRE(d->drivers[0].driver == "VER");
  REQUIRE(d->drivers[0].color == "#A259F7");
  REQUIRE(d->drivers[1].color == "#00B4D8");
  REQUIRE(d->drivers[2].color == "#43FF64");

  REQUIRE(d->colors[0] == "#A259F7");
  REQUIRE(d->colors[99] == "#A259F7");
  REQUIRE(d->colors[100] == "#00B4D8");
  REQUIRE(d->colors[199] == "#00B4D8");
  REQUIRE(d->colors[200] == "#43FF64");
  REQUIRE(d->colors[298] == "#43FF64");
}

TEST_CASE("circuit_dominance uses the given colors") {
  const std::vector<TelemetryLap> laps{make_constant_lap("HAM", 120, 150.0),
                                       make_constant_lap("RUS", 120, 250.0)};
  Error err{};
  auto d = circuit_dominance(laps, {"#C0C0C0", "#E8E8E8"}, CompareOptions{}, err);
  REQUIRE(d.has_value());
  REQUIRE(d->drivers[1].color == "#E8E8E8");
  for (const auto& c : d->colors) REQUIRE(c == "#E8E8E8");
}

TEST_CASE("circuit_dominance works for a single driver") {
  const std::vector<TelemetryLap> laps{make_constant_lap("ALO", 50, 180.0)};
  Error err{};
  auto d = circuit_dominance(laps, {}, CompareOptions{}, err);
  REQUIRE(d.has_value());
  REQUIRE(d->colors.size() == 49);
  for (const auto& c : d->colors) REQUIRE(c == "#A259F7");
}

TEST_CASE("circuit_dominance rejects bad requests") {
  Error err{};
  SECTION("no drivers") {
    REQUIRE_FALSE(circuit_dominance({}, {}, CompareOptions{}, err).has_value());
    REQUIRE(err.kind == ErrorKind::InvalidInput);
  }
  SECTION("too many drivers") {
    const std::vector<TelemetryLap> laps(4, make_constant_lap("X", 20, 100.0));
    REQUIRE_FALSE(circuit_dominance(laps, {}, CompareOptions{}, err).has_value());
    REQUIRE(err.kind == ErrorKind::InvalidInput);
  }
  SECTION("a driver without data") {
    TelemetryLap empty{};
    empty.name = "TSU";
    const std::vector<TelemetryLap> laps{make_constant_lap("GAS", 20, 100.0), empty};
    REQUIRE_FALSE(circuit_dominance(laps, {}, CompareOptions{}, err).has_value());
    REQUIRE(err.kind == ErrorKind::EmptyData);
    REQUIRE(err.driver == "TSU");
  }
}

TEST_CASE("validate_driver_codes normalizes and checks codes") {
  Error err{};
  std::vector<std::string> ok{" ver", "Ham", "NOR "};
  REQUIRE(validate_driver_codes(ok, kMaxDominanceDrivers, err));
  REQUIRE(ok == std::vector<std::string>{"VER", "HAM", "NOR"});

  std::vector<std::string> none;
  REQUIRE_FALSE(validate_driver_codes(none, kMaxDominanceDrivers, err));
  REQUIRE(err.kind == ErrorKind::InvalidInput);

  std::vector<std::string> many{"VER", "HAM", "NOR", "LEC"};
  REQUIRE_FALSE(validate_driver_codes(many, kMaxDominanceDrivers, err));

  std::vector<std::string> bad{"VER", "H4M"};
  REQUIRE_FALSE(validate_driver_codes(bad, kMaxDominanceDrivers, err));
  REQUIRE(err.driver == "H4M");

  std::vector<std::string> longer{"VERS"};
  REQUIRE_FALSE(validate_driver_codes(longer, kMaxDominanceDrivers, err));
}

TEST_CASE("a NaN distance row is rejected before resampling") {
  Logger::instance().set_console(false);
  std::istringstream ss("distance,x,y,speed\n0,0,0,100\n10,10,0,100\nnan,20,5,100\n");
  Error err{};
  auto lap = telemetry_from_csv_stream(ss, "VER", 1, err);
  REQUIRE(lap.has_value());

  const std::vector<TelemetryLap> laps{*lap, make_constant_lap("HAM", 20, 200.0)};
  REQUIRE_FALSE(circuit_dominance(laps, {}, CompareOptions{}, err).has_value());
  REQUIRE(err.kind == ErrorKind::InvalidInput);
  REQUIRE(err.driver == "VER");

  REQUIRE_FALSE(compare_drivers(laps[1], laps[0], "a", "b", CompareOptions{}, err).has_value());
  REQUIRE(err.kind == ErrorKind::InvalidInput);
  REQUIRE(err.driver == "VER");
  Logger::instance().set_console(true);
}
