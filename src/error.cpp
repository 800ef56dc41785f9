#include <lapcmp/error.hpp>

namespace lapcmp {

const char* to_string(ErrorKind k) {
  switch (k) {
    case ErrorKind::MissingChannel: return "missing channel";
    case ErrorKind::EmptyData:      return "empty data";
    case ErrorKind::InvalidInput:   return "invalid input";
  }
  return "unknown";
}

std::string describe(const Error& e) {
  std::string out;
  if (!e.stage.empty()) out += "[" + e.stage + "] ";
  if (!e.driver.empty()) out += e.driver + ": ";
  out += to_string(e.kind);
  if (!e.message.empty()) out += ": " + e.message;
  return out;
}

} // namespace lapcmp
