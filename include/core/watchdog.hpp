#pragma once

#include "logging/log.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <utility>

namespace lgtv {

// Watchdog — one-shot "still in flight" timer.
// Threading model:
// - Arm() starts a single std::jthread that sleeps for the threshold on a
//   stop-aware condition variable; arming twice is a no-op
// - If not cancelled in time, Fired() flips to true and then the callback runs
//   on the watchdog thread, exactly once
// - Cancel() requests stop and joins; it is idempotent and also runs from the
//   destructor, so the callback can never fire after the owner moved on
class Watchdog {
public:
  using Callback = std::function<void()>;

  Watchdog(std::chrono::milliseconds threshold, Callback callback)
      : threshold_(threshold), callback_(std::move(callback)) {}

  ~Watchdog() { Cancel(); }

  Watchdog(const Watchdog &) = delete;
  Watchdog &operator=(const Watchdog &) = delete;

  void Arm() {
    if (armed_.exchange(true)) {
      return;
    }
    worker_ = std::jthread([this](std::stop_token st) { this->Run(st); });
  }

  void Cancel() {
    if (!worker_.joinable()) {
      return;
    }
    worker_.request_stop();
    worker_.join();
    cancels_.fetch_add(1, std::memory_order_relaxed);
  }

  bool Fired() const { return fired_.load(std::memory_order_acquire); }

  // Number of Cancel() calls that stopped a running timer.
  int CancelCount() const { return cancels_.load(std::memory_order_relaxed); }

private:
  void Run(std::stop_token st) {
    {
      std::unique_lock<std::mutex> lock(mu_);
      const bool stopped = cv_.wait_for(lock, st, threshold_, [&st] {
        return st.stop_requested();
      });
      if (stopped) {
        return;
      }
    }
    if (fired_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    log::Debug("watchdog", "threshold of ", threshold_.count(),
               " ms elapsed");
    if (callback_) {
      callback_();
    }
  }

  std::chrono::milliseconds threshold_;
  Callback callback_;
  std::mutex mu_;
  std::condition_variable_any cv_;
  std::atomic<bool> armed_{false};
  std::atomic<bool> fired_{false};
  std::atomic<int> cancels_{0};
  std::jthread worker_;
};

} // namespace lgtv
