#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace lgtv::timeutil {

// Thread-safe local time conversion.
inline std::tm LocalTime(const std::time_t &tt) {
  std::tm tm{};
  localtime_r(&tt, &tm);
  return tm;
}

// Formats current local time with a strftime-like format string.
inline std::string NowLocalFormatted(const char *fmt) {
  const auto now = std::chrono::system_clock::now();
  const std::time_t tt = std::chrono::system_clock::to_time_t(now);
  const std::tm tm = LocalTime(tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, fmt);
  return oss.str();
}

// HH:MM:SS, used as the log line prefix
inline std::string ClockTime() { return NowLocalFormatted("%H:%M:%S"); }

} // namespace lgtv::timeutil
