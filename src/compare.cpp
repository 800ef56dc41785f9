#include <lapcmp/compare.hpp>
#include <algorithm>
#include <cctype>
#include <lapcmp/csv.hpp>
#include <lapcmp/interp.hpp>
#include <lapcmp/log.hpp>

namespace lapcmp {

static bool check_options(const CompareOptions& opts, const char* stage, Error& err) {
  if (opts.num_checkpoints < 2) {
    err = make_error(ErrorKind::InvalidInput, "", stage, "num_checkpoints must be at least 2");
    return false;
  }
  if (opts.num_microsectors == 0) {
    err = make_error(ErrorKind::InvalidInput, "", stage, "num_microsectors must be at least 1");
    return false;
  }
  return true;
}

std::optional<Comparison> compare_drivers(const TelemetryLap& driver1,
                                          const TelemetryLap& driver2,
                                          const std::string& color1,
                                          const std::string& color2,
                                          const CompareOptions& opts,
                                          Error& err) {
  if (!check_options(opts, "compare", err)) return std::nullopt;
  if (!check_lap(driver1, "compare", err) || !check_lap(driver2, "compare", err)) {
    LAPCMP_LOG_WARN("%s", describe(err).c_str());
    return std::nullopt;
  }

  // Driver 1 is the reference: both pilots follow its outline.
  const OrientedTrack track = optimize_orientation(driver1.x, driver1.y);

  auto synced = synchronize({&driver1, &driver2}, 0, track, opts.num_checkpoints, err);
  if (!synced) return std::nullopt;
  auto& s1 = (*synced)[0];
  auto& s2 = (*synced)[1];
  s1.color = color1;
  s2.color = color2;

  auto delta = delta_time(s1, s2, err);
  if (!delta) return std::nullopt;

  const std::vector<DriverTrace> traces{
    DriverTrace{s1.name, color1, &s1.speed},
    DriverTrace{s2.name, color2, &s2.speed},
  };
  auto sectors = microsector_colors(s1.size(), opts.num_microsectors, traces, err);
  if (!sectors) return std::nullopt;

  Comparison out{};
  out.circuit.x = s1.x;
  out.circuit.y = s1.y;
  out.circuit.colors = std::move(sectors->point_colors);
  out.delta = std::move(*delta);
  out.metadata.rotation_deg = track.rotation_deg;
  out.metadata.aspect_ratio = track.aspect_ratio;
  out.pilot1 = std::move(s1);
  out.pilot2 = std::move(s2);

  LAPCMP_LOG_INFO("Compared %s (lap %d) vs %s (lap %d): %zu checkpoints, final delta %+.3f s",
                  out.pilot1.name.c_str(), out.pilot1.lap,
                  out.pilot2.name.c_str(), out.pilot2.lap,
                  out.delta.size(), out.delta.back());
  return out;
}

std::optional<Comparison> compare_drivers(const TelemetryLap& driver1,
                                          const TelemetryLap& driver2,
                                          const DriverPalette& palette,
                                          const CompareOptions& opts,
                                          Error& err) {
  return compare_drivers(driver1, driver2,
                         palette.color_for(driver1.name), palette.color_for(driver2.name),
                         opts, err);
}

std::optional<Dominance> circuit_dominance(const std::vector<TelemetryLap>& laps,
                                           const std::vector<std::string>& colors,
                                           const CompareOptions& opts,
                                           Error& err) {
  if (!check_options(opts, "dominance", err)) return std::nullopt;
  if (laps.empty() || laps.size() > kMaxDominanceDrivers) {
    err = make_error(ErrorKind::InvalidInput, "", "dominance",
                     "expected 1 to " + std::to_string(kMaxDominanceDrivers) +
                     " drivers, got " + std::to_string(laps.size()));
    return std::nullopt;
  }
  for (const auto& lap : laps) {
    if (!check_lap(lap, "dominance", err)) {
      LAPCMP_LOG_WARN("%s", describe(err).c_str());
      return std::nullopt;
    }
  }

  const TelemetryLap& ref = laps.front();
  const OrientedTrack track = optimize_orientation(ref.x, ref.y);
  const std::size_t num_points = track.size();

  // Every driver's speed, one value per reference point.
  std::vector<std::vector<double>> aligned;
  aligned.reserve(laps.size());
  for (std::size_t i = 0; i < laps.size(); ++i) {
    if (i == 0) aligned.push_back(ref.speed);
    else aligned.push_back(interp(ref.distance, laps[i].distance, laps[i].speed));
  }

  Dominance out{};
  std::vector<DriverTrace> traces;
  traces.reserve(laps.size());
  for (std::size_t i = 0; i < laps.size(); ++i) {
    const std::string color = (i < colors.size() && !colors[i].empty())
      ? colors[i] : DriverPalette::dominance_color(i);
    traces.push_back(DriverTrace{laps[i].name, color, &aligned[i]});
    out.drivers.push_back(DominanceDriver{laps[i].name, color});
  }

  auto sectors = microsector_colors(num_points, opts.num_microsectors, traces, err);
  if (!sectors) return std::nullopt;

  out.x = track.x;
  out.y = track.y;
  out.metadata.rotation_deg = track.rotation_deg;
  out.metadata.aspect_ratio = track.aspect_ratio;
  // Segment i joins points i and i+1 and takes point i's color.
  auto& pc = sectors->point_colors;
  if (!pc.empty()) pc.pop_back();
  out.colors = std::move(pc);

  LAPCMP_LOG_INFO("Circuit dominance: %zu drivers over %zu points", laps.size(), num_points);
  return out;
}

bool validate_driver_codes(std::vector<std::string>& codes, std::size_t max_drivers, Error& err) {
  if (codes.empty()) {
    err = make_error(ErrorKind::InvalidInput, "", "request", "at least one driver must be specified");
    return false;
  }
  if (codes.size() > max_drivers) {
    err = make_error(ErrorKind::InvalidInput, "", "request",
                     "maximum " + std::to_string(max_drivers) + " drivers allowed");
    return false;
  }
  for (auto& c : codes) {
    c = csv::upper(csv::trim(c));
    const bool alpha = std::all_of(c.begin(), c.end(),
                                   [](unsigned char ch){ return std::isalpha(ch) != 0; });
    if (c.size() != 3 || !alpha) {
      err = make_error(ErrorKind::InvalidInput, c, "request",
                       "invalid driver code, must be 3 letters (e.g. VER, HAM)");
      return false;
    }
  }
  return true;
}

} // namespace lapcmp
