#include <cstdio>
#include <cstring>
#include <optional>
#include <string>
#include <utility>

#include <lapcmp/compare.hpp>
#include <lapcmp/log.hpp>
#include <lapcmp/palette.hpp>
#include <lapcmp/telemetry_csv.hpp>
#include <lapcmp/viewer/app.hpp>

using namespace lapcmp;

static int usage() {
  std::fprintf(stderr,
    "usage: lapcmp_viewer <lap1.csv> <name1> <lap2.csv> <name2> [--palette file] [--log file]\n");
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 5) return usage();

  std::string palette_path, log_path;
  for (int i = 5; i < argc; ++i) {
    if (std::strcmp(argv[i], "--palette") == 0 && i + 1 < argc) palette_path = argv[++i];
    else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) log_path = argv[++i];
    else return usage();
  }
  if (!log_path.empty() && !Logger::instance().open_file(log_path)) {
    LAPCMP_LOG_WARN("File logging disabled (could not open %s)", log_path.c_str());
  }

  DriverPalette palette = DriverPalette::builtin();
  if (!palette_path.empty()) {
    auto loaded = load_palette_csv(palette_path);
    if (!loaded) {
      LAPCMP_LOG_ERROR("Cannot open palette %s", palette_path.c_str());
      return 1;
    }
    palette = std::move(*loaded);
  }

  Error err{};
  auto lap1 = load_telemetry_csv(argv[1], argv[2], 0, err);
  if (!lap1) { std::fprintf(stderr, "%s\n", describe(err).c_str()); return 1; }
  auto lap2 = load_telemetry_csv(argv[3], argv[4], 0, err);
  if (!lap2) { std::fprintf(stderr, "%s\n", describe(err).c_str()); return 1; }

  auto cmp = compare_drivers(*lap1, *lap2, palette, CompareOptions{}, err);
  if (!cmp) { std::fprintf(stderr, "%s\n", describe(err).c_str()); return 1; }

  ViewerApp app(*cmp);
  return app.run();
}
