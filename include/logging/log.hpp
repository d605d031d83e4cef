#pragma once

#include "util/time.hpp"
#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string_view>
#include <utility>

// namespace lgtv::log — line-oriented stderr logging shared by all components.
// Each line reads "HH:MM:SS [tag] message". The threshold is process-wide and
// may be changed at any time (CLI --verbose); lines from the watchdog thread
// and the foreground thread never interleave mid-line.
namespace lgtv::log {

enum class Level { debug = 0, info = 1, warn = 2, error = 3 };

inline std::atomic<Level> &Threshold() {
  static std::atomic<Level> level{Level::warn};
  return level;
}

inline void SetLevel(Level level) {
  Threshold().store(level, std::memory_order_relaxed);
}

inline bool Enabled(Level level) {
  return level >= Threshold().load(std::memory_order_relaxed);
}

// Shared by every Write instantiation so whole lines reach stderr one at a time.
inline std::mutex &WriteMutex() {
  static std::mutex mu;
  return mu;
}

inline constexpr std::string_view LevelName(Level level) {
  switch (level) {
  case Level::debug:
    return "debug";
  case Level::info:
    return "info";
  case Level::warn:
    return "warn";
  case Level::error:
    return "error";
  }
  return "?";
}

template <typename... Args>
void Write(Level level, std::string_view tag, Args &&...args) {
  if (!Enabled(level)) {
    return;
  }
  std::ostringstream line;
  line << timeutil::ClockTime() << " [" << tag << "] ";
  if (level != Level::info) {
    line << LevelName(level) << ": ";
  }
  (line << ... << std::forward<Args>(args));
  line << '\n';
  std::lock_guard<std::mutex> lock(WriteMutex());
  std::cerr << line.str();
}

template <typename... Args>
void Debug(std::string_view tag, Args &&...args) {
  Write(Level::debug, tag, std::forward<Args>(args)...);
}

template <typename... Args>
void Info(std::string_view tag, Args &&...args) {
  Write(Level::info, tag, std::forward<Args>(args)...);
}

template <typename... Args>
void Warn(std::string_view tag, Args &&...args) {
  Write(Level::warn, tag, std::forward<Args>(args)...);
}

template <typename... Args>
void Error(std::string_view tag, Args &&...args) {
  Write(Level::error, tag, std::forward<Args>(args)...);
}

} // namespace lgtv::log
