#include <lapcmp/circuit.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <lapcmp/csv.hpp>

namespace lapcmp {

static bool is_header_row(const std::vector<std::string>& cols) {
  if (cols.size() < 2) return false;
  // Very light heuristic
  return csv::lower(cols[0]) == "key";
}

static std::optional<Circuit> parse_circuit_row(const std::vector<std::string>& cols) {
  if (cols.size() < 2) return std::nullopt;
  const std::string key = cols[0];
  if (key.empty()) return std::nullopt;

  const auto len = csv::to_double(cols[1]);
  if (!len || !std::isfinite(*len) || *len <= 0.0) return std::nullopt;

  double rot = 0.0;
  if (cols.size() >= 3 && !cols[2].empty()) {
    const auto r = csv::to_double(cols[2]);
    if (!r || !std::isfinite(*r)) return std::nullopt;
    rot = *r;
  }
  return Circuit{key, *len, rot};
}

static std::vector<Circuit> make_catalog_builtin() {
  return {
    {"Belgium",        7004.0, 0.0},  // Spa-Francorchamps
    {"Monaco",         3337.0, 0.0},
    {"Italy",          5793.0, 0.0},  // Monza
    {"Bahrain",        5412.0, 0.0},
    {"Spain",          4675.0, 0.0},  // Barcelona-Catalunya
    {"Austria",        4318.0, 0.0},  // Red Bull Ring
    {"Britain",        5891.0, 0.0},  // Silverstone
    {"Hungary",        4381.0, 0.0},
    {"Netherlands",    4259.0, 0.0},  // Zandvoort
    {"Singapore",      5063.0, 0.0},
    {"Japan",          5807.0, 0.0},  // Suzuka
    {"Qatar",          5380.0, 0.0},
    {"United States",  5513.0, 0.0},  // COTA
    {"Mexico",         4304.0, 0.0},
    {"Brazil",         4309.0, 0.0},  // Interlagos
    {"Las Vegas",      6201.0, 0.0},
    {"Abu Dhabi",      5281.0, 0.0},
    {"Australia",      5278.0, 0.0},
    {"Saudi Arabia",   6174.0, 0.0},
    {"Miami",          5412.0, 0.0},
    {"Emilia Romagna", 4909.0, 0.0},  // Imola
    {"Canada",         4361.0, 0.0},
    {"Azerbaijan",     6003.0, 0.0},
    {"China",          5451.0, 0.0},
  };
}

const std::vector<Circuit>& circuit_catalog() {
  static const std::vector<Circuit> cat = make_catalog_builtin();
  return cat;
}

std::optional<Circuit> circuit_by_key(const std::string& key) {
  return circuit_by_key_in(circuit_catalog(), key);
}

std::optional<Circuit> circuit_by_key_in(const std::vector<Circuit>& cat, const std::string& key) {
  auto it = std::find_if(cat.begin(), cat.end(), [&](const Circuit& c){ return c.key == key; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

std::vector<Circuit> circuit_catalog_from_csv_stream(std::istream& in) {
  std::vector<Circuit> out;
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    const std::string raw = csv::trim(line);
    if (csv::skip_line(raw)) continue;

    auto cols = csv::split_line(raw);

    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }

    if (auto row = parse_circuit_row(cols); row.has_value()) {
      out.push_back(*row);
    }
  }
  return out;
}

std::optional<std::vector<Circuit>> load_circuit_catalog_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return circuit_catalog_from_csv_stream(f);
}

} // namespace lapcmp
