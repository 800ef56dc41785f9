#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <lapcmp/delta.hpp>
#include <lapcmp/error.hpp>
#include <lapcmp/microsector.hpp>
#include <lapcmp/palette.hpp>
#include <lapcmp/sync.hpp>
#include <lapcmp/telemetry.hpp>
#include <lapcmp/track_geom.hpp>

namespace lapcmp {

inline constexpr std::size_t kMaxDominanceDrivers = 3;

struct CompareOptions {
  std::size_t num_checkpoints = kDefaultCheckpoints;
  std::size_t num_microsectors = kDefaultMicrosectors;
};

// Outline plus one microsector color per point.
struct CircuitView {
  std::vector<double> x;
  std::vector<double> y;
  std::vector<std::string> colors;
};

struct ComparisonMetadata {
  int rotation_deg{0};
  double aspect_ratio{0.0};
};

// Two-driver comparison, ready for a renderer.
struct Comparison {
  CircuitView circuit;
  SynchronizedTelemetry pilot1;
  SynchronizedTelemetry pilot2;
  DeltaSeries delta;
  ComparisonMetadata metadata;
};

struct DominanceDriver {
  std::string driver;
  std::string color;
};

// N-driver circuit dominance map. colors has one entry per segment between
// adjacent outline points (x.size() - 1 entries).
struct Dominance {
  std::vector<double> x;
  std::vector<double> y;
  std::vector<std::string> colors;
  std::vector<DominanceDriver> drivers;
  ComparisonMetadata metadata;
};

// Orient driver1's outline, resample both laps onto one checkpoint grid,
// integrate the delta and paint microsectors. All or nothing: on any failure
// err names the driver and stage and nullopt is returned.
std::optional<Comparison> compare_drivers(const TelemetryLap& driver1,
                                          const TelemetryLap& driver2,
                                          const std::string& color1,
                                          const std::string& color2,
                                          const CompareOptions& opts,
                                          Error& err);

// Same, with colors looked up by driver name.
std::optional<Comparison> compare_drivers(const TelemetryLap& driver1,
                                          const TelemetryLap& driver2,
                                          const DriverPalette& palette,
                                          const CompareOptions& opts,
                                          Error& err);

// Microsector dominance of 1..kMaxDominanceDrivers laps over laps[0]'s
// oriented outline. Each lap's speed is aligned to laps[0]'s samples by
// distance. colors[i] is used for laps[i]; missing entries fall back to the
// positional dominance palette.
std::optional<Dominance> circuit_dominance(const std::vector<TelemetryLap>& laps,
                                           const std::vector<std::string>& colors,
                                           const CompareOptions& opts,
                                           Error& err);

// Driver code sanity for request-facing callers: 1..max_drivers codes, each
// three letters. Codes are upper-cased in place.
bool validate_driver_codes(std::vector<std::string>& codes, std::size_t max_drivers, Error& err);

} // namespace lapcmp
