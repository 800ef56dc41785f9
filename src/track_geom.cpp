#include <lapcmp/track_geom.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <lapcmp/log.hpp>

namespace lapcmp {

static double mean_of(const std::vector<double>& v) {
  if (v.empty()) return 0.0;
  double sum = 0.0;
  for (double a : v) sum += a;
  return sum / static_cast<double>(v.size());
}

static double peak_to_peak(const std::vector<double>& v) {
  if (v.empty()) return 0.0;
  const auto [lo, hi] = std::minmax_element(v.begin(), v.end());
  return *hi - *lo;
}

void center_coordinates(const std::vector<double>& x, const std::vector<double>& y,
                        std::vector<double>& out_x, std::vector<double>& out_y) {
  const double mx = mean_of(x);
  const double my = mean_of(y);
  out_x.resize(x.size());
  out_y.resize(y.size());
  for (std::size_t i = 0; i < x.size(); ++i) out_x[i] = x[i] - mx;
  for (std::size_t i = 0; i < y.size(); ++i) out_y[i] = y[i] - my;
}

void rotate_coordinates(const std::vector<double>& x, const std::vector<double>& y,
                        double angle_rad,
                        std::vector<double>& out_x, std::vector<double>& out_y) {
  const std::size_t n = std::min(x.size(), y.size());
  const double c = std::cos(angle_rad);
  const double s = std::sin(angle_rad);
  out_x.resize(n);
  out_y.resize(n);
  for (std::size_t i = 0; i < n; ++i) {
    const double px = x[i], py = y[i];
    out_x[i] = px * c - py * s;
    out_y[i] = px * s + py * c;
  }
}

double aspect_ratio(const std::vector<double>& x, const std::vector<double>& y) {
  if (x.empty() || y.empty()) return 0.0;
  const double width  = peak_to_peak(x);
  const double height = peak_to_peak(y);
  if (height == 0.0) return std::numeric_limits<double>::infinity();
  return width / height;
}

OrientedTrack optimize_orientation(const std::vector<double>& x, const std::vector<double>& y) {
  std::vector<double> cx, cy;
  center_coordinates(x, y, cx, cy);

  OrientedTrack best{};
  best.x = cx;
  best.y = cy;
  best.rotation_deg = 0;
  best.aspect_ratio = 0.0;
  if (cx.empty() || cy.empty()) return best;

  std::vector<double> rx, ry;
  for (int deg = 0; deg < kRotationEndDeg; deg += kRotationStepDeg) {
    rotate_coordinates(cx, cy, deg * kDegToRad, rx, ry);
    const double ratio = aspect_ratio(rx, ry);
    // Strict '>' keeps the first angle on ties.
    if (ratio > best.aspect_ratio) {
      best.aspect_ratio = ratio;
      best.rotation_deg = deg;
      best.x = rx;
      best.y = ry;
    }
  }

  LAPCMP_LOG_INFO("Track oriented: %d deg rotation, ratio %.2f", best.rotation_deg, best.aspect_ratio);
  return best;
}

} // namespace lapcmp
