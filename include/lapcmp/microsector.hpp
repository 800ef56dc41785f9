#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <lapcmp/error.hpp>

namespace lapcmp {

inline constexpr std::size_t kDefaultMicrosectors = 25;

// Half-open index range [begin, end).
struct SectorRange {
  std::size_t begin{0};
  std::size_t end{0};
  std::size_t size() const { return end - begin; }
  bool empty() const { return end <= begin; }
};

// One competitor of a dominance classification. speed is not owned and must
// hold one value per point.
struct DriverTrace {
  std::string name;
  std::string color;
  const std::vector<double>* speed{nullptr};
};

struct MicrosectorAssignment {
  std::vector<SectorRange> sectors;
  std::vector<std::size_t> winners;       // index into the driver list, per sector
  std::vector<std::string> sector_colors; // winner color, per sector
  std::vector<std::string> point_colors;  // sector color, per point
};

// Split [0, num_points) into num_sectors contiguous ranges of
// floor(num_points / num_sectors) points; the last range takes the remainder.
// num_sectors == 0 yields no ranges.
std::vector<SectorRange> sector_ranges(std::size_t num_points, std::size_t num_sectors);

// Per sector, the driver with the strictly highest mean speed. Ties and
// sectors without samples go to drivers[0].
std::vector<std::size_t> classify_sectors(const std::vector<SectorRange>& sectors,
                                          const std::vector<DriverTrace>& drivers);

// Paint every point with its sector's color.
std::vector<std::string> expand_sector_colors(const std::vector<SectorRange>& sectors,
                                              const std::vector<std::string>& sector_colors,
                                              std::size_t num_points);

// Full pipeline: ranges -> winners -> per-point colors.
std::optional<MicrosectorAssignment> microsector_colors(std::size_t num_points,
                                                        std::size_t num_sectors,
                                                        const std::vector<DriverTrace>& drivers,
                                                        Error& err);

} // namespace lapcmp
