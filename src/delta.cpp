#include <lapcmp/delta.hpp>
#include <algorithm>
#include <string>
#include <lapcmp/log.hpp>

namespace lapcmp {

std::optional<DeltaSeries> delta_time(const SynchronizedTelemetry& a,
                                      const SynchronizedTelemetry& b,
                                      Error& err) {
  const std::size_t n = a.distance.size();
  if (n == 0) {
    err = make_error(ErrorKind::EmptyData, a.name, "delta", "no checkpoints");
    return std::nullopt;
  }
  if (b.distance.size() != n || a.speed.size() != n || b.speed.size() != n) {
    err = make_error(ErrorKind::InvalidInput, a.name + "/" + b.name, "delta",
                     "laps are not on the same checkpoint grid");
    LAPCMP_LOG_WARN("%s", describe(err).c_str());
    return std::nullopt;
  }

  DeltaSeries delta(n, 0.0);
  double acc = 0.0;
  for (std::size_t i = 0; i + 1 < n; ++i) {
    const double dd = a.distance[i + 1] - a.distance[i];
    const double t_a = dd / (a.speed[i] / kKmhPerMps + kSpeedEpsilon);
    const double t_b = dd / (b.speed[i] / kKmhPerMps + kSpeedEpsilon);
    acc += t_a - t_b;
    delta[i + 1] = acc;
  }
  return delta;
}

std::vector<double> elapsed_time(const SynchronizedTelemetry& t) {
  const std::size_t n = std::min(t.distance.size(), t.speed.size());
  std::vector<double> out(n, 0.0);
  for (std::size_t i = 0; i + 1 < n; ++i) {
    const double dd = t.distance[i + 1] - t.distance[i];
    out[i + 1] = out[i] + dd / (t.speed[i] / kKmhPerMps + kSpeedEpsilon);
  }
  return out;
}

} // namespace lapcmp
