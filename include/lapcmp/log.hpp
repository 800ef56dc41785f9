#pragma once
#include <atomic>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <string>

namespace lapcmp {

enum class LogLevel : int { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

const char* to_string(LogLevel lv);

// Process-wide logger. Writes to stderr and, once open_file() succeeded,
// to a log file as well. Safe to call from several threads.
class Logger {
public:
  static Logger& instance();

  void set_level(LogLevel lv);
  LogLevel level() const { return level_.load(std::memory_order_relaxed); }
  bool enabled(LogLevel lv) const {
    const LogLevel cur = level();
    return cur != LogLevel::Off && lv >= cur;
  }

  // Truncates the file. Returns false if it cannot be opened.
  bool open_file(const std::string& path);
  void close_file();

  // Disable the stderr sink (tests keep their output clean this way).
  void set_console(bool on);

  void write(LogLevel lv, const char* message);

  template <typename... Args>
  void writef(LogLevel lv, const char* fmt, Args... args) {
    if (!enabled(lv)) return;
    char buf[1024];
    std::snprintf(buf, sizeof(buf), fmt, args...);
    write(lv, buf);
  }

private:
  Logger() = default;
  ~Logger() { close_file(); }
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  static void timestamp_(char* out, std::size_t cap);

  std::mutex mu_;
  std::ofstream file_;
  std::atomic<LogLevel> level_{LogLevel::Info};
  bool console_{true};
};

} // namespace lapcmp

#define LAPCMP_LOG_DEBUG(...) ::lapcmp::Logger::instance().writef(::lapcmp::LogLevel::Debug, __VA_ARGS__)
#define LAPCMP_LOG_INFO(...)  ::lapcmp::Logger::instance().writef(::lapcmp::LogLevel::Info,  __VA_ARGS__)
#define LAPCMP_LOG_WARN(...)  ::lapcmp::Logger::instance().writef(::lapcmp::LogLevel::Warn,  __VA_ARGS__)
#define LAPCMP_LOG_ERROR(...) ::lapcmp::Logger::instance().writef(::lapcmp::LogLevel::Error, __VA_ARGS__)
