#include <lapcmp/telemetry.hpp>
#include <cmath>
#include <string>

namespace lapcmp {

static bool check_channel(const TelemetryLap& lap, const char* stage, const char* channel,
                          const std::vector<double>& v, bool required, Error& err) {
  if (v.empty() && !required) return true;
  if (v.size() == lap.distance.size()) return true;
  std::string msg = channel;
  if (v.empty()) {
    msg += " is absent";
  } else {
    msg += " has " + std::to_string(v.size()) + " samples, distance has " +
           std::to_string(lap.distance.size());
  }
  err = make_error(ErrorKind::MissingChannel, lap.name, stage, msg);
  return false;
}

// Distance must be finite and non-decreasing; the resampler searches it.
static bool check_distance(const TelemetryLap& lap, const char* stage, Error& err) {
  const auto& d = lap.distance;
  for (std::size_t i = 0; i < d.size(); ++i) {
    if (!std::isfinite(d[i])) {
      err = make_error(ErrorKind::InvalidInput, lap.name, stage,
                       "distance is not finite at sample " + std::to_string(i));
      return false;
    }
    if (i > 0 && d[i] < d[i-1]) {
      err = make_error(ErrorKind::InvalidInput, lap.name, stage,
                       "distance decreases at sample " + std::to_string(i));
      return false;
    }
  }
  return true;
}

bool check_lap(const TelemetryLap& lap, const char* stage, Error& err) {
  if (lap.distance.empty()) {
    if (lap.x.empty() && lap.y.empty() && lap.speed.empty()) {
      err = make_error(ErrorKind::EmptyData, lap.name, stage, "no samples");
    } else {
      err = make_error(ErrorKind::MissingChannel, lap.name, stage, "distance is absent");
    }
    return false;
  }
  return check_channel(lap, stage, "x", lap.x, true, err)
      && check_channel(lap, stage, "y", lap.y, true, err)
      && check_channel(lap, stage, "speed", lap.speed, true, err)
      && check_channel(lap, stage, "throttle", lap.throttle, false, err)
      && check_channel(lap, stage, "brake", lap.brake, false, err)
      && check_distance(lap, stage, err);
}

} // namespace lapcmp
