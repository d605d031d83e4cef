#pragma once

#include "logging/log.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace lgtv {

enum class Urgency { low, normal, critical };

inline constexpr std::string_view ToString(Urgency u) {
  switch (u) {
  case Urgency::low:
    return "low";
  case Urgency::normal:
    return "normal";
  case Urgency::critical:
    return "critical";
  }
  return "normal";
}

struct Notification {
  std::string title;
  std::string message;
  Urgency urgency = Urgency::normal;
  int timeoutMs = 2000;
  std::optional<std::string> icon;
};

// INotificationSink — fire-and-forget user-facing notifications.
// Implementations must not throw and must return promptly; they may be called
// from the watchdog thread.
class INotificationSink {
public:
  virtual ~INotificationSink() = default;
  virtual void Notify(const Notification &n) noexcept = 0;
};

// Writes notifications to the log instead of the desktop.
class LogNotificationSink : public INotificationSink {
public:
  void Notify(const Notification &n) noexcept override {
    const auto level =
        n.urgency == Urgency::critical ? log::Level::error : log::Level::info;
    try {
      log::Write(level, "notify", n.title, ": ", n.message);
    } catch (const std::exception &) {
      // stderr is gone; nowhere left to report to
    }
  }
};

} // namespace lgtv
