#include <lapcmp/telemetry_csv.hpp>
#include <fstream>
#include <vector>
#include <lapcmp/csv.hpp>
#include <lapcmp/log.hpp>

namespace lapcmp {

static constexpr const char* kStage = "load";

namespace {

struct Column {
  const char* name;
  bool required;
  std::vector<double>* out;
  int pos{-1};
};

// Header row first, then one sample per row. Rows with a missing cell or a
// bad number are dropped as a whole so channels stay aligned.
bool read_columns(std::istream& in, const std::string& name, std::vector<Column>& cols, Error& err) {
  bool have_header = false;
  std::size_t rows = 0;
  std::size_t skipped = 0;
  std::string line;
  std::vector<double> row(cols.size(), 0.0);

  while (std::getline(in, line)) {
    const std::string raw = csv::trim(line);
    if (csv::skip_line(raw)) continue;
    const auto cells = csv::split_line(raw);

    if (!have_header) {
      for (std::size_t i = 0; i < cells.size(); ++i) {
        const std::string key = csv::lower(cells[i]);
        for (auto& c : cols) {
          if (key == c.name) c.pos = static_cast<int>(i);
        }
      }
      for (const auto& c : cols) {
        if (c.required && c.pos < 0) {
          err = make_error(ErrorKind::MissingChannel, name, kStage,
                           std::string("column '") + c.name + "' not in header");
          LAPCMP_LOG_WARN("%s", describe(err).c_str());
          return false;
        }
      }
      have_header = true;
      continue;
    }

    bool ok = true;
    for (std::size_t k = 0; k < cols.size() && ok; ++k) {
      const int p = cols[k].pos;
      if (p < 0) continue;
      if (static_cast<std::size_t>(p) >= cells.size()) { ok = false; break; }
      const auto v = csv::to_double(cells[static_cast<std::size_t>(p)]);
      if (!v) { ok = false; break; }
      row[k] = *v;
    }
    if (!ok) { ++skipped; continue; }
    for (std::size_t k = 0; k < cols.size(); ++k) {
      if (cols[k].pos >= 0) cols[k].out->push_back(row[k]);
    }
    ++rows;
  }

  if (skipped > 0) LAPCMP_LOG_WARN("%s: skipped %zu malformed rows", name.c_str(), skipped);

  if (!have_header) {
    err = make_error(ErrorKind::EmptyData, name, kStage, "no header row");
    return false;
  }
  if (rows == 0) {
    err = make_error(ErrorKind::EmptyData, name, kStage, "no telemetry rows");
    LAPCMP_LOG_WARN("%s", describe(err).c_str());
    return false;
  }
  return true;
}

} // namespace

std::optional<TelemetryLap> telemetry_from_csv_stream(std::istream& in,
                                                      const std::string& name,
                                                      int lap_number,
                                                      Error& err) {
  TelemetryLap lap{};
  lap.name = name;
  lap.lap = lap_number;
  std::vector<Column> cols{
    {"distance", true,  &lap.distance},
    {"x",        true,  &lap.x},
    {"y",        true,  &lap.y},
    {"speed",    true,  &lap.speed},
    {"throttle", false, &lap.throttle},
    {"brake",    false, &lap.brake},
  };
  if (!read_columns(in, name, cols, err)) return std::nullopt;
  return lap;
}

std::optional<RawGpsLap> raw_gps_from_csv_stream(std::istream& in,
                                                 const std::string& name,
                                                 int lap_number,
                                                 Error& err) {
  RawGpsLap raw{};
  raw.name = name;
  raw.lap = lap_number;
  std::vector<Column> cols{
    {"x",        true,  &raw.x_mm},
    {"y",        true,  &raw.y_mm},
    {"speed",    true,  &raw.speed},
    {"throttle", false, &raw.throttle},
    {"brake",    false, &raw.brake},
  };
  if (!read_columns(in, name, cols, err)) return std::nullopt;
  return raw;
}

std::optional<TelemetryLap> load_telemetry_csv(const std::string& path,
                                               const std::string& name,
                                               int lap,
                                               Error& err) {
  std::ifstream f(path);
  if (!f) {
    err = make_error(ErrorKind::EmptyData, name, kStage, "cannot open " + path);
    LAPCMP_LOG_ERROR("%s", describe(err).c_str());
    return std::nullopt;
  }
  return telemetry_from_csv_stream(f, name, lap, err);
}

std::optional<RawGpsLap> load_raw_gps_csv(const std::string& path,
                                          const std::string& name,
                                          int lap,
                                          Error& err) {
  std::ifstream f(path);
  if (!f) {
    err = make_error(ErrorKind::EmptyData, name, kStage, "cannot open " + path);
    LAPCMP_LOG_ERROR("%s", describe(err).c_str());
    return std::nullopt;
  }
  return raw_gps_from_csv_stream(f, name, lap, err);
}

} // namespace lapcmp
