#include <lapcmp/trajectory.hpp>
#include <cmath>
#include <initializer_list>
#include <string>
#include <lapcmp/log.hpp>
#include <lapcmp/track_geom.hpp>

namespace lapcmp {

static constexpr const char* kStage = "trajectory";

static void keep_masked(const std::vector<double>& in, const std::vector<bool>& keep,
                        std::vector<double>& out) {
  out.clear();
  if (in.size() != keep.size()) { out = in; return; }
  for (std::size_t i = 0; i < in.size(); ++i) if (keep[i]) out.push_back(in[i]);
}

RawGpsLap drop_invalid_points(const RawGpsLap& raw) {
  const std::size_t n = raw.x_mm.size() < raw.y_mm.size() ? raw.x_mm.size() : raw.y_mm.size();
  std::vector<bool> keep(raw.x_mm.size(), false);
  for (std::size_t i = 0; i < n; ++i) {
    keep[i] = !std::isnan(raw.x_mm[i]) && !std::isnan(raw.y_mm[i]);
  }

  RawGpsLap out{};
  out.name = raw.name;
  out.lap = raw.lap;
  keep_masked(raw.x_mm, keep, out.x_mm);
  keep_masked(raw.y_mm, keep, out.y_mm);
  keep_masked(raw.speed, keep, out.speed);
  keep_masked(raw.throttle, keep, out.throttle);
  keep_masked(raw.brake, keep, out.brake);
  return out;
}

std::vector<double> cumulative_distance(const std::vector<double>& x, const std::vector<double>& y) {
  const std::size_t n = x.size() < y.size() ? x.size() : y.size();
  std::vector<double> cum(n, 0.0);
  for (std::size_t i = 1; i < n; ++i) {
    const double dx = x[i] - x[i-1];
    const double dy = y[i] - y[i-1];
    cum[i] = cum[i-1] + std::sqrt(dx*dx + dy*dy);
  }
  return cum;
}

void scale_distance(std::vector<double>& distance, double target_length) {
  if (distance.empty() || target_length <= 0.0) return;
  const double current = distance.back();
  if (current <= 0.0) return;
  const double k = target_length / current;
  for (auto& d : distance) d *= k;
}

std::optional<TelemetryLap> prepare_gps_lap(const RawGpsLap& raw,
                                            double circuit_rotation_deg,
                                            double official_length_m,
                                            Error& err) {
  const std::size_t n = raw.x_mm.size();
  if (raw.y_mm.size() != n || raw.speed.size() != n) {
    const char* which = raw.y_mm.size() != n ? "y" : "speed";
    err = make_error(ErrorKind::MissingChannel, raw.name, kStage,
                     std::string(which) + " does not match x (" + std::to_string(n) + " samples)");
    LAPCMP_LOG_WARN("%s", describe(err).c_str());
    return std::nullopt;
  }

  for (const auto* ch : {&raw.throttle, &raw.brake}) {
    if (!ch->empty() && ch->size() != n) {
      const char* which = ch == &raw.throttle ? "throttle" : "brake";
      err = make_error(ErrorKind::MissingChannel, raw.name, kStage,
                       std::string(which) + " has " + std::to_string(ch->size()) +
                       " samples, x has " + std::to_string(n));
      LAPCMP_LOG_WARN("%s", describe(err).c_str());
      return std::nullopt;
    }
  }

  const RawGpsLap clean = drop_invalid_points(raw);
  if (clean.x_mm.empty()) {
    err = make_error(ErrorKind::EmptyData, raw.name, kStage, "no valid GPS points");
    LAPCMP_LOG_WARN("%s", describe(err).c_str());
    return std::nullopt;
  }
  LAPCMP_LOG_DEBUG("Valid GPS points for %s: %zu of %zu", raw.name.c_str(), clean.x_mm.size(), n);

  TelemetryLap lap{};
  lap.name = raw.name;
  lap.lap = raw.lap;
  rotate_coordinates(clean.x_mm, clean.y_mm, circuit_rotation_deg * kDegToRad, lap.x, lap.y);
  for (auto& v : lap.x) v /= kMillimetersPerMeter;
  for (auto& v : lap.y) v /= kMillimetersPerMeter;

  lap.distance = cumulative_distance(lap.x, lap.y);
  if (official_length_m > 0.0) {
    scale_distance(lap.distance, official_length_m);
  } else {
    LAPCMP_LOG_DEBUG("No official length for %s, keeping measured %.1f m",
                     raw.name.c_str(), lap.distance.back());
  }

  lap.speed = clean.speed;
  lap.throttle = clean.throttle;
  lap.brake = clean.brake;
  return lap;
}

} // namespace lapcmp
