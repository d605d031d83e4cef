#pragma once

#include <string_view>

namespace lgtv {

// Forward-only progression; Done and Failed are terminal.
enum class SessionState {
  New,
  Connecting,
  Registered,
  AwaitingResponse,
  Done,
  Failed
};

inline constexpr bool IsTerminal(SessionState s) {
  return s == SessionState::Done || s == SessionState::Failed;
}

// A transition is legal when it moves strictly forward from a non-terminal
// state. Failed is reachable from every non-terminal state.
inline constexpr bool CanAdvance(SessionState from, SessionState to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == SessionState::Failed) {
    return true;
  }
  return static_cast<int>(to) > static_cast<int>(from);
}

inline constexpr std::string_view ToString(SessionState s) {
  switch (s) {
  case SessionState::New:
    return "new";
  case SessionState::Connecting:
    return "connecting";
  case SessionState::Registered:
    return "registered";
  case SessionState::AwaitingResponse:
    return "awaiting_response";
  case SessionState::Done:
    return "done";
  case SessionState::Failed:
    return "failed";
  }
  return "unknown";
}

} // namespace lgtv
