#pragma once
#include <istream>
#include <optional>
#include <string>
#include <lapcmp/error.hpp>
#include <lapcmp/telemetry.hpp>
#include <lapcmp/trajectory.hpp>

namespace lapcmp {

// Lap telemetry CSV. The first non-comment line is a header naming the
// columns in any order; recognized names are distance, x, y, speed, throttle
// and brake (case-insensitive, unknown columns ignored). distance, x, y and
// speed must be present. Rows with a bad number are skipped.
std::optional<TelemetryLap> telemetry_from_csv_stream(std::istream& in,
                                                      const std::string& name,
                                                      int lap,
                                                      Error& err);

// Filesystem wrapper; EmptyData if the file cannot be opened.
std::optional<TelemetryLap> load_telemetry_csv(const std::string& path,
                                               const std::string& name,
                                               int lap,
                                               Error& err);

// Raw GPS export: x and y in millimeters ("nan" where the fix dropped out),
// speed, optional throttle and brake. No distance column; it is derived later
// by prepare_gps_lap().
std::optional<RawGpsLap> raw_gps_from_csv_stream(std::istream& in,
                                                 const std::string& name,
                                                 int lap,
                                                 Error& err);

std::optional<RawGpsLap> load_raw_gps_csv(const std::string& path,
                                          const std::string& name,
                                          int lap,
                                          Error& err);

} // namespace lapcmp
