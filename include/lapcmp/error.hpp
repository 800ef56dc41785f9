#pragma once
#include <string>
#include <utility>

namespace lapcmp {

// MissingChannel and InvalidInput mean the caller handed us bad data;
// EmptyData means the data simply is not there (e.g. no valid GPS points).
enum class ErrorKind : int {
  MissingChannel = 0,
  EmptyData = 1,
  InvalidInput = 2,
};

struct Error {
  ErrorKind kind{ErrorKind::InvalidInput};
  std::string driver;   // originating driver, empty if not driver-specific
  std::string stage;    // "normalize", "synchronize", "delta", ...
  std::string message;
};

const char* to_string(ErrorKind k);

// "[synchronize] VER: missing channel: speed has 10 samples, distance has 12"
std::string describe(const Error& e);

inline Error make_error(ErrorKind kind, std::string driver, std::string stage, std::string message) {
  return Error{kind, std::move(driver), std::move(stage), std::move(message)};
}

} // namespace lapcmp
