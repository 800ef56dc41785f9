#include <lapcmp/log.hpp>
#include <chrono>
#include <ctime>

namespace lapcmp {

const char* to_string(LogLevel lv) {
  switch (lv) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    default: return "OFF";
  }
}

Logger& Logger::instance() {
  static Logger inst;
  return inst;
}

void Logger::set_level(LogLevel lv) {
  level_.store(lv, std::memory_order_relaxed);
}

void Logger::set_console(bool on) {
  std::lock_guard<std::mutex> lk(mu_);
  console_ = on;
}

bool Logger::open_file(const std::string& path) {
  std::lock_guard<std::mutex> lk(mu_);
  if (file_.is_open()) file_.close();
  file_.open(path, std::ios::out | std::ios::trunc);
  return file_.is_open();
}

void Logger::close_file() {
  std::lock_guard<std::mutex> lk(mu_);
  if (file_.is_open()) file_.close();
}

void Logger::timestamp_(char* out, std::size_t cap) {
  using clock = std::chrono::system_clock;
  const auto now = clock::now();
  const std::time_t t = clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch()).count() % 1000;
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  char hms[16];
  std::strftime(hms, sizeof(hms), "%H:%M:%S", &tm);
  std::snprintf(out, cap, "%s.%03d", hms, static_cast<int>(ms));
}

void Logger::write(LogLevel lv, const char* message) {
  if (!enabled(lv)) return;
  char ts[24];
  timestamp_(ts, sizeof(ts));

  char line[1100]; // message + timestamp + level
  std::snprintf(line, sizeof(line), "[%s] [%s] %s", ts, to_string(lv), message);

  std::lock_guard<std::mutex> lk(mu_);
  if (console_) std::fprintf(stderr, "%s\n", line);
  if (file_.is_open()) {
    file_ << line << '\n';
    file_.flush();
  }
}

} // namespace lapcmp
