#pragma once
#include <optional>
#include <vector>
#include <lapcmp/error.hpp>
#include <lapcmp/telemetry.hpp>

namespace lapcmp {

inline constexpr double kKmhPerMps = 3.6;
inline constexpr double kSpeedEpsilon = 1e-6; // m/s, keeps standing starts finite

// Cumulative time delta of a vs b along their shared checkpoints.
//
// This is an approximation: each interval is traversed at the speed sampled
// at its start, dt = distance / speed, and the per-interval differences are
// summed. It does not use real lap timestamps, so on intervals with a large
// speed change it drifts from the official timing delta. Consumers rely on
// this exact behavior; keep it.
//
// Result has a.size() entries, result[0] == 0.0, positive = a behind b.
std::optional<DeltaSeries> delta_time(const SynchronizedTelemetry& a,
                                      const SynchronizedTelemetry& b,
                                      Error& err);

// Running lap time (s) at each checkpoint under the same local-speed
// approximation; result[0] == 0.0. Used for playback, not for the delta.
std::vector<double> elapsed_time(const SynchronizedTelemetry& t);

} // namespace lapcmp
