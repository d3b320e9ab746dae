#include "revcache/log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>

namespace revcache {
namespace {
std::mutex log_mu;
std::atomic<bool> quiet{false};

std::string timestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

const char *level_name(LogLevel level) {
  switch (level) {
  case LogLevel::Info:
    return "info";
  case LogLevel::Warn:
    return "warn";
  case LogLevel::Error:
    return "error";
  }
  return "info";
}
} // namespace

void log_line(LogLevel level, const std::string &msg) {
  if (quiet && level == LogLevel::Info)
    return;
  const std::string line = timestamp() + " [" + level_name(level) + "] " + msg;
  std::lock_guard<std::mutex> lk(log_mu);
  auto &out = level == LogLevel::Info ? std::cout : std::cerr;
  out << line << "\n";
  out.flush();
}

void set_log_quiet(bool q) { quiet = q; }

} // namespace revcache
