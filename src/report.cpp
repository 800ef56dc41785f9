#include <lapcmp/report.hpp>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <lapcmp/log.hpp>

namespace lapcmp {

namespace {

void put_number(std::ostream& os, double v) {
  if (!std::isfinite(v)) { os << "null"; return; }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.10g", v);
  os << buf;
}

void put_string(std::ostream& os, const std::string& s) {
  os << '"';
  for (char c : s) {
    switch (c) {
      case '"':  os << "\\\""; break;
      case '\\': os << "\\\\"; break;
      case '\n': os << "\\n";  break;
      case '\t': os << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char esc[8];
          std::snprintf(esc, sizeof(esc), "\\u%04x", static_cast<unsigned>(c));
          os << esc;
        } else {
          os << c;
        }
    }
  }
  os << '"';
}

void put_numbers(std::ostream& os, const std::vector<double>& v) {
  os << '[';
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (i) os << ',';
    put_number(os, v[i]);
  }
  os << ']';
}

void put_strings(std::ostream& os, const std::vector<std::string>& v) {
  os << '[';
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (i) os << ',';
    put_string(os, v[i]);
  }
  os << ']';
}

void put_metadata(std::ostream& os, const ComparisonMetadata& m) {
  os << "{\"rotation\":" << m.rotation_deg << ",\"aspect_ratio\":";
  put_number(os, m.aspect_ratio);
  os << '}';
}

void put_pilot(std::ostream& os, const SynchronizedTelemetry& p) {
  os << "{\"name\":";       put_string(os, p.name);
  os << ",\"lap\":" << p.lap;
  os << ",\"color\":";      put_string(os, p.color);
  os << ",\"distance\":";   put_numbers(os, p.distance);
  os << ",\"x\":";          put_numbers(os, p.x);
  os << ",\"y\":";          put_numbers(os, p.y);
  os << ",\"speed\":";      put_numbers(os, p.speed);
  os << ",\"throttle\":";   put_numbers(os, p.throttle);
  os << ",\"brake\":";      put_numbers(os, p.brake);
  os << '}';
}

// Value at i or empty cell if the channel is absent.
void put_cell(std::ostream& os, const std::vector<double>& v, std::size_t i) {
  os << ',';
  if (i < v.size()) put_number(os, v[i]);
}

} // namespace

void write_comparison_json(std::ostream& os, const Comparison& c) {
  os << "{\n";
  os << "  \"circuit\": {\"x\":";  put_numbers(os, c.circuit.x);
  os << ",\"y\":";                 put_numbers(os, c.circuit.y);
  os << ",\"colors\":";            put_strings(os, c.circuit.colors);
  os << "},\n";
  os << "  \"pilot1\": ";          put_pilot(os, c.pilot1); os << ",\n";
  os << "  \"pilot2\": ";          put_pilot(os, c.pilot2); os << ",\n";
  os << "  \"delta\": ";           put_numbers(os, c.delta); os << ",\n";
  os << "  \"metadata\": ";        put_metadata(os, c.metadata); os << "\n";
  os << "}\n";
}

void write_dominance_json(std::ostream& os, const Dominance& d) {
  os << "{\n";
  os << "  \"x\": ";      put_numbers(os, d.x); os << ",\n";
  os << "  \"y\": ";      put_numbers(os, d.y); os << ",\n";
  os << "  \"colors\": "; put_strings(os, d.colors); os << ",\n";
  os << "  \"drivers\": [";
  for (std::size_t i = 0; i < d.drivers.size(); ++i) {
    if (i) os << ',';
    os << "{\"driver\":"; put_string(os, d.drivers[i].driver);
    os << ",\"color\":";  put_string(os, d.drivers[i].color);
    os << '}';
  }
  os << "],\n";
  os << "  \"metadata\": "; put_metadata(os, d.metadata); os << "\n";
  os << "}\n";
}

void write_comparison_csv(std::ostream& os, const Comparison& c) {
  const auto& a = c.pilot1;
  const auto& b = c.pilot2;
  os << "distance,x,y,color,"
     << a.name << "_speed," << a.name << "_throttle," << a.name << "_brake,"
     << b.name << "_speed," << b.name << "_throttle," << b.name << "_brake,delta\n";
  for (std::size_t i = 0; i < a.distance.size(); ++i) {
    put_number(os, a.distance[i]);
    put_cell(os, a.x, i);
    put_cell(os, a.y, i);
    os << ',' << (i < c.circuit.colors.size() ? c.circuit.colors[i] : std::string{});
    put_cell(os, a.speed, i);
    put_cell(os, a.throttle, i);
    put_cell(os, a.brake, i);
    put_cell(os, b.speed, i);
    put_cell(os, b.throttle, i);
    put_cell(os, b.brake, i);
    put_cell(os, c.delta, i);
    os << '\n';
  }
}

bool save_comparison_json(const std::string& path, const Comparison& c) {
  std::ofstream f(path, std::ios::binary);
  if (!f) { LAPCMP_LOG_ERROR("Cannot write %s", path.c_str()); return false; }
  write_comparison_json(f, c);
  return static_cast<bool>(f);
}

bool save_dominance_json(const std::string& path, const Dominance& d) {
  std::ofstream f(path, std::ios::binary);
  if (!f) { LAPCMP_LOG_ERROR("Cannot write %s", path.c_str()); return false; }
  write_dominance_json(f, d);
  return static_cast<bool>(f);
}

bool save_comparison_csv(const std::string& path, const Comparison& c) {
  std::ofstream f(path, std::ios::binary);
  if (!f) { LAPCMP_LOG_ERROR("Cannot write %s", path.c_str()); return false; }
  write_comparison_csv(f, c);
  return static_cast<bool>(f);
}

} // namespace lapcmp
