#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <iterator>
#include <vector>

namespace lapcmp {

inline double lerp(double a, double b, double t) { return a + (b - a) * t; }

// n evenly spaced values over [start, stop], both ends included.
// n == 1 yields {start}; n == 0 yields an empty vector.
inline std::vector<double> linspace(double start, double stop, std::size_t n) {
  std::vector<double> out(n, start);
  if (n < 2) return out;
  const double step = (stop - start) / static_cast<double>(n - 1);
  for (std::size_t i = 0; i < n; ++i) out[i] = start + step * static_cast<double>(i);
  out.back() = stop;
  return out;
}

// Piecewise-linear lookup of fp(xp) at xq.
// - xp must be non-decreasing and the same length as fp (caller checks).
// - Outside [xp.front(), xp.back()] the boundary value is held.
// - On repeated xp values the later sample wins.
// - A NaN query yields NaN.
inline double interp_at(double xq, const std::vector<double>& xp, const std::vector<double>& fp) {
  const std::size_t n = std::min(xp.size(), fp.size());
  if (n == 0) return 0.0;
  if (std::isnan(xq)) return std::numeric_limits<double>::quiet_NaN();
  if (xq < xp.front()) return fp.front();
  if (xq >= xp[n-1]) return fp[n-1];

  // Bracket [i0, i1] with xp[i0] <= xq < xp[i1]
  auto it = std::upper_bound(xp.begin(), xp.begin() + static_cast<std::ptrdiff_t>(n), xq);
  std::size_t i1 = static_cast<std::size_t>(std::distance(xp.begin(), it));
  if (i1 >= n) i1 = n - 1;
  if (i1 == 0) return fp.front();
  const std::size_t i0 = i1 - 1;

  const double span = xp[i1] - xp[i0];
  const double t = span > 0.0 ? (xq - xp[i0]) / span : 0.0;
  return lerp(fp[i0], fp[i1], t);
}

// Vectorized interp_at over all query points.
inline std::vector<double> interp(const std::vector<double>& xq,
                                  const std::vector<double>& xp,
                                  const std::vector<double>& fp) {
  std::vector<double> out;
  out.reserve(xq.size());
  for (double q : xq) out.push_back(interp_at(q, xp, fp));
  return out;
}

} // namespace lapcmp
