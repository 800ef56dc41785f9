#include <lapcmp/palette.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <lapcmp/csv.hpp>

namespace lapcmp {

DriverPalette::DriverPalette(std::vector<Entry> entries, std::string fallback)
  : entries_(std::move(entries)), fallback_(std::move(fallback)) {
  for (auto& e : entries_) e.first = csv::upper(e.first);
}

static DriverPalette make_builtin() {
  return DriverPalette({
    // Red Bull
    {"VER", "#0600EF"}, {"PER", "#3671C6"},
    // Ferrari
    {"LEC", "#DC0000"}, {"SAI", "#FF6B6B"},
    // Mercedes
    {"HAM", "#C0C0C0"}, {"RUS", "#E8E8E8"},
    // McLaren
    {"NOR", "#FF8700"}, {"PIA", "#FFB347"},
    // Aston Martin
    {"ALO", "#00665F"}, {"STR", "#2BA572"},
    // Alpine
    {"GAS", "#FF87BC"}, {"OCO", "#FFC0E3"},
    // Williams
    {"ALB", "#041E42"}, {"SAR", "#1B4F91"}, {"COL", "#2E6DB5"},
    // RB
    {"TSU", "#FFFFFF"}, {"RIC", "#F5F5F5"}, {"LAW", "#DCDCDC"},
    // Kick Sauber
    {"BOT", "#52E252"}, {"ZHO", "#90EE90"},
    // Haas
    {"MAG", "#787878"}, {"HUL", "#A8A8A8"}, {"BEA", "#959595"},
    // Reserve
    {"DOO", "#FFB0D3"},
  });
}

const DriverPalette& DriverPalette::builtin() {
  static const DriverPalette pal = make_builtin();
  return pal;
}

const std::string& DriverPalette::color_for(const std::string& code) const {
  const std::string key = csv::upper(csv::trim(code));
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&](const Entry& e){ return e.first == key; });
  if (it == entries_.end()) return fallback_;
  return it->second;
}

std::vector<std::string> DriverPalette::colors_for(const std::vector<std::string>& codes) const {
  std::vector<std::string> out;
  out.reserve(codes.size());
  for (const auto& c : codes) out.push_back(color_for(c));
  return out;
}

bool DriverPalette::contains(const std::string& code) const {
  const std::string key = csv::upper(csv::trim(code));
  return std::any_of(entries_.begin(), entries_.end(),
                     [&](const Entry& e){ return e.first == key; });
}

const std::string& DriverPalette::dominance_color(std::size_t index) {
  static const std::array<std::string, 3> kDominance{"#A259F7", "#00B4D8", "#43FF64"};
  return index < kDominance.size() ? kDominance[index] : kDominance[0];
}

bool is_hex_color(const std::string& s) {
  if (s.size() != 7 || s[0] != '#') return false;
  return std::all_of(s.begin() + 1, s.end(),
                     [](unsigned char c){ return std::isxdigit(c) != 0; });
}

static bool is_header_row(const std::vector<std::string>& cols) {
  return !cols.empty() && csv::lower(cols[0]) == "code";
}

DriverPalette palette_from_csv_stream(std::istream& in) {
  std::vector<DriverPalette::Entry> entries;
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    const std::string raw = csv::trim(line);
    if (csv::skip_line(raw)) continue;

    const auto cols = csv::split_line(raw);
    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }
    if (cols.size() < 2 || cols[0].empty() || !is_hex_color(cols[1])) continue;
    entries.emplace_back(cols[0], cols[1]);
  }
  return DriverPalette{std::move(entries)};
}

std::optional<DriverPalette> load_palette_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return palette_from_csv_stream(f);
}

} // namespace lapcmp
