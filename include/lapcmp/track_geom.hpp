#pragma once
#include <vector>
#include <cstddef>
#include <numbers>

namespace lapcmp {

// Constant naming convention (kCamelCase)
inline constexpr double kPI  = std::numbers::pi_v<double>;
inline constexpr double kDegToRad = kPI / 180.0;

// Orientation search grid: 0, 10, ..., 170 degrees.
inline constexpr int kRotationStepDeg = 10;
inline constexpr int kRotationEndDeg  = 180; // exclusive

// Track outline centered at the origin and rotated for display.
struct OrientedTrack {
  std::vector<double> x;
  std::vector<double> y;
  int rotation_deg{0};
  double aspect_ratio{0.0};   // width / height, +inf for zero height

  std::size_t size() const { return x.size(); }
};

// Translate so that the centroid lands on (0,0).
void center_coordinates(const std::vector<double>& x, const std::vector<double>& y,
                        std::vector<double>& out_x, std::vector<double>& out_y);

// Rotate around the origin (counter-clockwise, radians).
void rotate_coordinates(const std::vector<double>& x, const std::vector<double>& y,
                        double angle_rad,
                        std::vector<double>& out_x, std::vector<double>& out_y);

// Peak-to-peak width over peak-to-peak height; +inf if height is zero,
// 0 for an empty outline.
double aspect_ratio(const std::vector<double>& x, const std::vector<double>& y);

// Center the outline, then try every grid angle and keep the one with the
// widest aspect ratio. Ties keep the earliest angle. Never fails; degenerate
// outlines come back with ratio 0 (empty) or +inf (flat).
OrientedTrack optimize_orientation(const std::vector<double>& x, const std::vector<double>& y);

} // namespace lapcmp
