#pragma once

#include <string>

namespace revcache {

enum class LogLevel { Info, Warn, Error };

// Writes one timestamped line. Info goes to stdout, the rest to stderr.
// Safe to call from connection threads.
void log_line(LogLevel level, const std::string &msg);

inline void log_info(const std::string &msg) { log_line(LogLevel::Info, msg); }
inline void log_warn(const std::string &msg) { log_line(LogLevel::Warn, msg); }
inline void log_error(const std::string &msg) {
  log_line(LogLevel::Error, msg);
}

void set_log_quiet(bool quiet);

} // namespace revcache
