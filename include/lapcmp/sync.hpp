#pragma once
#include <cstddef>
#include <optional>
#include <vector>
#include <lapcmp/error.hpp>
#include <lapcmp/telemetry.hpp>
#include <lapcmp/track_geom.hpp>

namespace lapcmp {

inline constexpr std::size_t kDefaultCheckpoints = 1000;

// num_points checkpoints over [0, max last distance of all laps].
// Laps without samples are ignored; all-empty input yields an empty grid.
std::vector<double> make_checkpoints(const std::vector<const TelemetryLap*>& laps,
                                     std::size_t num_points);

// One channel of a lap evaluated at every checkpoint. Holds the boundary
// value past the lap's own range. Empty channel -> empty result.
std::vector<double> resample_channel(const std::vector<double>& checkpoints,
                                     const std::vector<double>& distance,
                                     const std::vector<double>& channel);

// Resample every lap onto one checkpoint grid and pin them all to the
// reference outline (computed from laps[reference] via optimize_orientation).
// The outline is itself resampled along the reference lap's distance so that
// distance, x and y all have num_points entries.
// Output order matches input order. name/lap are copied, color is left empty.
std::optional<std::vector<SynchronizedTelemetry>>
synchronize(const std::vector<const TelemetryLap*>& laps,
            std::size_t reference,
            const OrientedTrack& track,
            std::size_t num_points,
            Error& err);

} // namespace lapcmp
