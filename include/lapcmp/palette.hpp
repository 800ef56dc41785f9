#pragma once
#include <istream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lapcmp {

inline constexpr const char* kDefaultDriverColor = "#A259F7";

// Immutable driver -> display color table. Built once (builtin or CSV) and
// passed by const reference wherever colors are needed.
class DriverPalette {
public:
  using Entry = std::pair<std::string, std::string>; // code, "#RRGGBB"

  DriverPalette() = default;
  explicit DriverPalette(std::vector<Entry> entries,
                         std::string fallback = kDefaultDriverColor);

  // 2024 grid, team-derived colors.
  static const DriverPalette& builtin();

  // Case-insensitive. Unknown codes get the fallback color.
  const std::string& color_for(const std::string& code) const;
  std::vector<std::string> colors_for(const std::vector<std::string>& codes) const;
  bool contains(const std::string& code) const;

  // Positional colors for the N-driver dominance map (purple, blue, green).
  // Out-of-range indices wrap to the first color.
  static const std::string& dominance_color(std::size_t index);

  const std::vector<Entry>& entries() const { return entries_; }
  const std::string& fallback() const { return fallback_; }
  std::size_t size() const { return entries_.size(); }

private:
  std::vector<Entry> entries_; // codes stored upper-case
  std::string fallback_{kDefaultDriverColor};
};

// "#RRGGBB" (case-insensitive hex digits).
bool is_hex_color(const std::string& s);

// Stream-based CSV loader: "code,color". Optional header row, '#' comments and
// blank lines ignored, rows with a bad code or color skipped.
DriverPalette palette_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<DriverPalette> load_palette_csv(const std::string& path);

} // namespace lapcmp
