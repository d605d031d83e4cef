#pragma once

#include <chrono>
#include <functional>
#include <thread>

// namespace retry — pacing between orchestrated attempts.
// Linear rather than exponential: the dominant delay after a TV wakes is a
// fixed wake-up latency, not congestion.
namespace lgtv::retry {

struct LinearBackoff {
  std::chrono::milliseconds base{500};

  // Delay before the attempt following attemptIndex (0-based).
  std::chrono::milliseconds After(int attemptIndex) const {
    return base * (attemptIndex + 1);
  }
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline void WaitSync(std::chrono::milliseconds delay) {
  std::this_thread::sleep_for(delay);
}

} // namespace lgtv::retry
