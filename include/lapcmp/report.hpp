#pragma once
#include <ostream>
#include <string>
#include <lapcmp/compare.hpp>

namespace lapcmp {

// JSON layout:
//   { "circuit": {"x","y","colors"}, "pilot1": {...}, "pilot2": {...},
//     "delta": [...], "metadata": {"rotation","aspect_ratio"} }
// Non-finite numbers (e.g. a flat outline's aspect ratio) are written as null.
void write_comparison_json(std::ostream& os, const Comparison& c);

// { "x", "y", "colors", "drivers": [{"driver","color"}], "metadata" }
void write_dominance_json(std::ostream& os, const Dominance& d);

// One row per checkpoint:
// distance,x,y,color,<p1>_speed,<p1>_throttle,<p1>_brake,<p2>_speed,...,delta
void write_comparison_csv(std::ostream& os, const Comparison& c);

// File wrappers; false if the file cannot be opened.
bool save_comparison_json(const std::string& path, const Comparison& c);
bool save_dominance_json(const std::string& path, const Dominance& d);
bool save_comparison_csv(const std::string& path, const Comparison& c);

} // namespace lapcmp
