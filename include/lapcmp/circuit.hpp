#pragma once
#include <optional>
#include <string>
#include <vector>
#include <istream>

namespace lapcmp {

struct Circuit {
  std::string key;          // Grand Prix name, e.g. "Belgium"
  double length_m;          // official lap length
  double rotation_deg;      // provider map rotation, 0 if unknown
};

// Built-in catalog of official lap lengths (default/fallback).
const std::vector<Circuit>& circuit_catalog();

// Lookup helpers (exact key match)
std::optional<Circuit> circuit_by_key(const std::string& key);
std::optional<Circuit> circuit_by_key_in(const std::vector<Circuit>& cat, const std::string& key);

// Stream-based CSV loader: "key,length_m[,rotation_deg]".
// Accepts an optional header row; ignores lines starting with '#' and blank lines.
// Whitespace around fields is trimmed. Invalid rows (bad numbers, length <= 0) are skipped.
std::vector<Circuit> circuit_catalog_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<std::vector<Circuit>> load_circuit_catalog_csv(const std::string& path);

} // namespace lapcmp
