#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <lapcmp/error.hpp>

namespace lapcmp {

// One driver's lap, sampled along distance. Channels are parallel arrays.
// distance, x, y and speed are required; throttle and brake may be left
// empty when the provider did not supply them.
struct TelemetryLap {
  std::string name;              // driver identifier, e.g. "VER"
  int lap{0};

  std::vector<double> distance;  // meters, non-decreasing
  std::vector<double> x;         // meters
  std::vector<double> y;         // meters
  std::vector<double> speed;     // km/h
  std::vector<double> throttle;  // 0..100
  std::vector<double> brake;     // 0..100

  std::size_t size() const { return distance.size(); }
  bool empty() const { return distance.empty(); }
};

// A driver's telemetry resampled onto the checkpoint grid shared by every
// driver of one comparison. distance, x and y are identical across drivers.
struct SynchronizedTelemetry {
  std::string name;
  int lap{0};
  std::string color;             // "#RRGGBB"

  std::vector<double> distance;
  std::vector<double> x;
  std::vector<double> y;
  std::vector<double> speed;
  std::vector<double> throttle;  // empty if the source lap had no throttle
  std::vector<double> brake;     // empty if the source lap had no brake

  std::size_t size() const { return distance.size(); }
};

// delta[i]: cumulative time difference (s) of driver 1 vs driver 2 up to
// checkpoint i. Positive means driver 1 is behind.
using DeltaSeries = std::vector<double>;

// Checks that a lap carries every required channel at the length of its
// distance axis and has at least one sample. On failure fills err (naming
// lap.name and stage) and returns false.
bool check_lap(const TelemetryLap& lap, const char* stage, Error& err);

} // namespace lapcmp
