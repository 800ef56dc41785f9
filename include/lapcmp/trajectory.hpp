#pragma once
#include <optional>
#include <string>
#include <vector>
#include <lapcmp/error.hpp>
#include <lapcmp/telemetry.hpp>

namespace lapcmp {

inline constexpr double kMillimetersPerMeter = 1000.0;

// A lap as the timing provider hands it out: positions in millimeters, in the
// provider's map frame, possibly with NaN holes where GPS dropped out.
struct RawGpsLap {
  std::string name;
  int lap{0};
  std::vector<double> x_mm;
  std::vector<double> y_mm;
  std::vector<double> speed;     // km/h
  std::vector<double> throttle;  // optional
  std::vector<double> brake;     // optional
};

// Copy of raw without the samples whose x or y is NaN. Every channel is
// filtered with the same mask.
RawGpsLap drop_invalid_points(const RawGpsLap& raw);

// 0-prefixed running sum of segment lengths.
std::vector<double> cumulative_distance(const std::vector<double>& x, const std::vector<double>& y);

// Scale so that the last value equals target_length. No-op if either the
// current length or the target is not positive.
void scale_distance(std::vector<double>& distance, double target_length);

// NaN filter -> rotate by the circuit's map angle -> mm to m -> distance
// along the trace, optionally stretched to the official lap length
// (official_length_m <= 0 keeps the measured length).
std::optional<TelemetryLap> prepare_gps_lap(const RawGpsLap& raw,
                                            double circuit_rotation_deg,
                                            double official_length_m,
                                            Error& err);

} // namespace lapcmp
