#pragma once
#include <cmath>
#include <string>
#include <vector>

#include <lapcmp/telemetry.hpp>
#include <lapcmp/track_geom.hpp>

namespace lapcmp::testing {

// Ellipse lap (semi-axes a, b meters) sampled at n points, distance measured
// along the polyline. speed_at(i) gives the km/h for sample i.
template <class SpeedFn>
TelemetryLap make_ellipse_lap(const std::string& name, std::size_t n,
                              double a, double b, SpeedFn speed_at) {
  TelemetryLap lap{};
  lap.name = name;
  lap.lap = 1;
  double dist = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const double t = 2.0 * kPI * double(i) / double(n);
    const double x = a * std::cos(t);
    const double y = b * std::sin(t);
    if (i > 0) {
      const double dx = x - lap.x.back();
      const double dy = y - lap.y.back();
      dist += std::sqrt(dx*dx + dy*dy);
    }
    lap.distance.push_back(dist);
    lap.x.push_back(x);
    lap.y.push_back(y);
    lap.speed.push_back(speed_at(i));
    lap.throttle.push_back(100.0);
    lap.brake.push_back(0.0);
  }
  return lap;
}

inline TelemetryLap make_constant_lap(const std::string& name, std::size_t n, double kmh) {
  return make_ellipse_lap(name, n, 300.0, 100.0, [kmh](std::size_t){ return kmh; });
}

} // namespace lapcmp::testing
