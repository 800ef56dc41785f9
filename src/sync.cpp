#include <lapcmp/sync.hpp>
#include <algorithm>
#include <string>
#include <lapcmp/interp.hpp>
#include <lapcmp/log.hpp>

namespace lapcmp {

static constexpr const char* kStage = "synchronize";

std::vector<double> make_checkpoints(const std::vector<const TelemetryLap*>& laps,
                                     std::size_t num_points) {
  bool any = false;
  double max_distance = 0.0;
  for (const auto* lap : laps) {
    if (!lap || lap->distance.empty()) continue;
    max_distance = any ? std::max(max_distance, lap->distance.back()) : lap->distance.back();
    any = true;
  }
  if (!any) return {};
  return linspace(0.0, max_distance, num_points);
}

std::vector<double> resample_channel(const std::vector<double>& checkpoints,
                                     const std::vector<double>& distance,
                                     const std::vector<double>& channel) {
  if (channel.empty() || distance.empty()) return {};
  return interp(checkpoints, distance, channel);
}

std::optional<std::vector<SynchronizedTelemetry>>
synchronize(const std::vector<const TelemetryLap*>& laps,
            std::size_t reference,
            const OrientedTrack& track,
            std::size_t num_points,
            Error& err) {
  if (num_points < 2) {
    err = make_error(ErrorKind::InvalidInput, "", kStage,
                     "need at least 2 checkpoints, got " + std::to_string(num_points));
    return std::nullopt;
  }
  if (laps.empty() || reference >= laps.size()) {
    err = make_error(ErrorKind::InvalidInput, "", kStage, "reference lap out of range");
    return std::nullopt;
  }
  for (const auto* lap : laps) {
    if (!lap) {
      err = make_error(ErrorKind::EmptyData, "", kStage, "null lap");
      return std::nullopt;
    }
    if (!check_lap(*lap, kStage, err)) {
      LAPCMP_LOG_WARN("%s", describe(err).c_str());
      return std::nullopt;
    }
  }

  const TelemetryLap& ref = *laps[reference];
  if (track.x.size() != ref.distance.size() || track.y.size() != ref.distance.size()) {
    err = make_error(ErrorKind::InvalidInput, ref.name, kStage,
                     "outline has " + std::to_string(track.x.size()) +
                     " points, reference lap has " + std::to_string(ref.distance.size()));
    LAPCMP_LOG_WARN("%s", describe(err).c_str());
    return std::nullopt;
  }

  const std::vector<double> checkpoints = make_checkpoints(laps, num_points);

  // Shared trajectory: the reference outline pinned onto the checkpoints.
  const std::vector<double> shared_x = interp(checkpoints, ref.distance, track.x);
  const std::vector<double> shared_y = interp(checkpoints, ref.distance, track.y);

  std::vector<SynchronizedTelemetry> out;
  out.reserve(laps.size());
  for (const auto* lap : laps) {
    SynchronizedTelemetry st{};
    st.name = lap->name;
    st.lap = lap->lap;
    st.distance = checkpoints;
    st.x = shared_x;
    st.y = shared_y;
    st.speed    = resample_channel(checkpoints, lap->distance, lap->speed);
    st.throttle = resample_channel(checkpoints, lap->distance, lap->throttle);
    st.brake    = resample_channel(checkpoints, lap->distance, lap->brake);
    out.push_back(std::move(st));
  }

  LAPCMP_LOG_DEBUG("Synchronized %zu laps on %zu checkpoints up to %.1f m",
                   laps.size(), checkpoints.size(), checkpoints.back());
  return out;
}

} // namespace lapcmp
