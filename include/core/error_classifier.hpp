#pragma once

#include <array>
#include <boost/algorithm/string/predicate.hpp>
#include <optional>
#include <string>
#include <string_view>

// ErrorClassifier — decides whether a failure description denotes a transient
// transport/handshake fault worth retrying. Matching is plain substring search
// over the description; protocol rejections, auth failures and local wait
// timeouts carry none of the markers and are therefore permanent.
namespace lgtv::classify {

// TLS faults, connection reset/refused/aborted, unexpected EOF, connect
// timeouts.
inline constexpr std::array<std::string_view, 4> kTransientMarkers = {
    "SSL", "Connection", "EOF", "timed out"};

inline bool IsRetryable(std::string_view error) {
  for (std::string_view marker : kTransientMarkers) {
    if (boost::algorithm::contains(error, marker)) {
      return true;
    }
  }
  return false;
}

// A missing error (no description recorded) is never retried.
inline bool ShouldRetry(const std::optional<std::string> &error) {
  return error.has_value() && IsRetryable(*error);
}

} // namespace lgtv::classify
