#include <lapcmp/microsector.hpp>
#include <lapcmp/log.hpp>

namespace lapcmp {

static constexpr const char* kStage = "microsectors";

std::vector<SectorRange> sector_ranges(std::size_t num_points, std::size_t num_sectors) {
  std::vector<SectorRange> out;
  if (num_sectors == 0) return out;
  out.reserve(num_sectors);
  const std::size_t per = num_points / num_sectors;
  for (std::size_t k = 0; k < num_sectors; ++k) {
    SectorRange r{};
    r.begin = k * per;
    r.end = (k + 1 == num_sectors) ? num_points : (k + 1) * per;
    out.push_back(r);
  }
  return out;
}

static bool mean_over(const std::vector<double>& v, const SectorRange& r, double& out) {
  if (r.empty() || r.begin >= v.size()) return false;
  const std::size_t end = r.end < v.size() ? r.end : v.size();
  double sum = 0.0;
  for (std::size_t i = r.begin; i < end; ++i) sum += v[i];
  out = sum / static_cast<double>(end - r.begin);
  return true;
}

std::vector<std::size_t> classify_sectors(const std::vector<SectorRange>& sectors,
                                          const std::vector<DriverTrace>& drivers) {
  std::vector<std::size_t> winners(sectors.size(), 0);
  for (std::size_t k = 0; k < sectors.size(); ++k) {
    bool have_best = false;
    double best = 0.0;
    std::size_t best_idx = 0;
    for (std::size_t d = 0; d < drivers.size(); ++d) {
      if (!drivers[d].speed) continue;
      double m = 0.0;
      if (!mean_over(*drivers[d].speed, sectors[k], m)) continue;
      if (!have_best || m > best) {
        best = m;
        best_idx = d;
        have_best = true;
      }
    }
    winners[k] = best_idx;
  }
  return winners;
}

std::vector<std::string> expand_sector_colors(const std::vector<SectorRange>& sectors,
                                              const std::vector<std::string>& sector_colors,
                                              std::size_t num_points) {
  std::vector<std::string> out(num_points);
  const std::size_t n = sectors.size() < sector_colors.size() ? sectors.size() : sector_colors.size();
  for (std::size_t k = 0; k < n; ++k) {
    const std::size_t end = sectors[k].end < num_points ? sectors[k].end : num_points;
    for (std::size_t i = sectors[k].begin; i < end; ++i) out[i] = sector_colors[k];
  }
  return out;
}

std::optional<MicrosectorAssignment> microsector_colors(std::size_t num_points,
                                                        std::size_t num_sectors,
                                                        const std::vector<DriverTrace>& drivers,
                                                        Error& err) {
  if (num_points == 0) {
    err = make_error(ErrorKind::EmptyData, "", kStage, "no points to classify");
    return std::nullopt;
  }
  if (num_sectors == 0) {
    err = make_error(ErrorKind::InvalidInput, "", kStage, "num_sectors must be at least 1");
    return std::nullopt;
  }
  if (drivers.empty()) {
    err = make_error(ErrorKind::InvalidInput, "", kStage, "no drivers");
    return std::nullopt;
  }
  for (const auto& d : drivers) {
    if (!d.speed || d.speed->size() != num_points) {
      err = make_error(ErrorKind::InvalidInput, d.name, kStage,
                       "speed has " + std::to_string(d.speed ? d.speed->size() : 0) +
                       " values, expected " + std::to_string(num_points));
      LAPCMP_LOG_WARN("%s", describe(err).c_str());
      return std::nullopt;
    }
  }

  MicrosectorAssignment out{};
  out.sectors = sector_ranges(num_points, num_sectors);
  out.winners = classify_sectors(out.sectors, drivers);
  out.sector_colors.reserve(out.winners.size());
  for (std::size_t w : out.winners) out.sector_colors.push_back(drivers[w].color);
  out.point_colors = expand_sector_colors(out.sectors, out.sector_colors, num_points);

  LAPCMP_LOG_DEBUG("Microsectors: %zu sectors, %zu points per sector",
                   out.sectors.size(), num_points / num_sectors);
  return out;
}

} // namespace lapcmp
