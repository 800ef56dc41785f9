#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <lapcmp/circuit.hpp>
#include <lapcmp/compare.hpp>
#include <lapcmp/log.hpp>
#include <lapcmp/palette.hpp>
#include <lapcmp/report.hpp>
#include <lapcmp/telemetry_csv.hpp>
#include <lapcmp/trajectory.hpp>

using namespace lapcmp;

static int usage() {
  std::fprintf(stderr,
    "usage:\n"
    "  lapcmp_report compare <lap1.csv> <name1> <lap2.csv> <name2> [--json out] [--csv out]\n"
    "  lapcmp_report dominance <lap.csv> <name> [<lap.csv> <name> ...] [--json out]\n"
    "common options: --sectors N  --checkpoints N  --palette file  --log file  --verbose\n"
    "  --gps CIRCUIT [--circuits file]   inputs are raw GPS exports (x,y in mm),\n"
    "                                    oriented and scaled to the circuit's official length\n");
  return 2;
}

struct Args {
  std::vector<std::string> positional;
  std::string json_out, csv_out, palette_path, log_path, gps_circuit, circuits_path;
  CompareOptions opts{};
  bool verbose{false};
};

// Where laps come from: telemetry CSVs as-is, or raw GPS exports prepared
// against a catalog circuit.
struct LapSource {
  std::optional<Circuit> circuit;

  std::optional<TelemetryLap> load(const std::string& path, const std::string& name, Error& err) const {
    if (!circuit) return load_telemetry_csv(path, name, 0, err);
    auto raw = load_raw_gps_csv(path, name, 0, err);
    if (!raw) return std::nullopt;
    return prepare_gps_lap(*raw, circuit->rotation_deg, circuit->length_m, err);
  }
};

static bool parse_count(const char* s, std::size_t& out) {
  char* end = nullptr;
  const unsigned long v = std::strtoul(s, &end, 10);
  if (end == s || *end != '\0' || v == 0) return false;
  out = static_cast<std::size_t>(v);
  return true;
}

static bool parse_args(int argc, char** argv, Args& a) {
  for (int i = 2; i < argc; ++i) {
    const char* arg = argv[i];
    const bool has_value = i + 1 < argc;
    if      (std::strcmp(arg, "--json") == 0 && has_value)    a.json_out = argv[++i];
    else if (std::strcmp(arg, "--csv") == 0 && has_value)     a.csv_out = argv[++i];
    else if (std::strcmp(arg, "--palette") == 0 && has_value) a.palette_path = argv[++i];
    else if (std::strcmp(arg, "--log") == 0 && has_value)     a.log_path = argv[++i];
    else if (std::strcmp(arg, "--gps") == 0 && has_value)     a.gps_circuit = argv[++i];
    else if (std::strcmp(arg, "--circuits") == 0 && has_value) a.circuits_path = argv[++i];
    else if (std::strcmp(arg, "--sectors") == 0 && has_value) {
      if (!parse_count(argv[++i], a.opts.num_microsectors)) return false;
    } else if (std::strcmp(arg, "--checkpoints") == 0 && has_value) {
      if (!parse_count(argv[++i], a.opts.num_checkpoints)) return false;
    } else if (std::strcmp(arg, "--verbose") == 0) {
      a.verbose = true;
    } else if (arg[0] == '-' && arg[1] == '-') {
      return false;
    } else {
      a.positional.emplace_back(arg);
    }
  }
  return true;
}

static int fail(const Error& err) {
  LAPCMP_LOG_ERROR("%s", describe(err).c_str());
  return 1;
}

static int run_compare(const Args& a, const LapSource& src, const DriverPalette& palette) {
  if (a.positional.size() != 4) return usage();
  Error err{};
  auto lap1 = src.load(a.positional[0], a.positional[1], err);
  if (!lap1) return fail(err);
  auto lap2 = src.load(a.positional[2], a.positional[3], err);
  if (!lap2) return fail(err);

  auto cmp = compare_drivers(*lap1, *lap2, palette, a.opts, err);
  if (!cmp) return fail(err);

  if (!a.json_out.empty()) {
    if (!save_comparison_json(a.json_out, *cmp)) return 1;
  }
  if (!a.csv_out.empty()) {
    if (!save_comparison_csv(a.csv_out, *cmp)) return 1;
  }
  if (a.json_out.empty() && a.csv_out.empty()) write_comparison_json(std::cout, *cmp);
  return 0;
}

static int run_dominance(const Args& a, const LapSource& src) {
  if (a.positional.empty() || a.positional.size() % 2 != 0) return usage();

  std::vector<std::string> codes;
  for (std::size_t i = 1; i < a.positional.size(); i += 2) codes.push_back(a.positional[i]);
  Error err{};
  if (!validate_driver_codes(codes, kMaxDominanceDrivers, err)) return fail(err);

  std::vector<TelemetryLap> laps;
  for (std::size_t i = 0; i < codes.size(); ++i) {
    auto lap = src.load(a.positional[2 * i], codes[i], err);
    if (!lap) return fail(err);
    laps.push_back(std::move(*lap));
  }

  auto dom = circuit_dominance(laps, {}, a.opts, err);
  if (!dom) return fail(err);

  if (!a.json_out.empty()) return save_dominance_json(a.json_out, *dom) ? 0 : 1;
  write_dominance_json(std::cout, *dom);
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 2) return usage();
  Args a{};
  if (!parse_args(argc, argv, a)) return usage();

  Logger::instance().set_level(a.verbose ? LogLevel::Debug : LogLevel::Info);
  if (!a.log_path.empty() && !Logger::instance().open_file(a.log_path)) {
    LAPCMP_LOG_WARN("File logging disabled (could not open %s)", a.log_path.c_str());
  }

  DriverPalette palette = DriverPalette::builtin();
  if (!a.palette_path.empty()) {
    auto loaded = load_palette_csv(a.palette_path);
    if (!loaded) {
      LAPCMP_LOG_ERROR("Cannot open palette %s", a.palette_path.c_str());
      return 1;
    }
    palette = std::move(*loaded);
  }

  LapSource src{};
  if (!a.gps_circuit.empty()) {
    std::vector<Circuit> catalog = circuit_catalog();
    if (!a.circuits_path.empty()) {
      auto loaded = load_circuit_catalog_csv(a.circuits_path);
      if (!loaded) {
        LAPCMP_LOG_ERROR("Cannot open circuit catalog %s", a.circuits_path.c_str());
        return 1;
      }
      catalog = std::move(*loaded);
    }
    src.circuit = circuit_by_key_in(catalog, a.gps_circuit);
    if (!src.circuit) {
      LAPCMP_LOG_ERROR("Unknown circuit '%s'", a.gps_circuit.c_str());
      return 1;
    }
    LAPCMP_LOG_INFO("GPS input for %s: %.0f m, rotation %.1f deg",
                    src.circuit->key.c_str(), src.circuit->length_m, src.circuit->rotation_deg);
  }

  const std::string cmd = argv[1];
  if (cmd == "compare")   return run_compare(a, src, palette);
  if (cmd == "dominance") return run_dominance(a, src);
  return usage();
}
