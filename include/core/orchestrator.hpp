#pragma once

#include "core/command.hpp"
#include "core/error_classifier.hpp"
#include "core/watchdog.hpp"
#include "logging/log.hpp"
#include "net/backoff.hpp"
#include "notify/notification_sink.hpp"
#include "sessions/session.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace lgtv {

struct RetryPolicy {
  int maxAttempts = 3;
  std::chrono::milliseconds baseDelay{500};
  // "Connecting to TV..." is shown once an Execute call runs longer than this.
  std::chrono::milliseconds slowThreshold{1000};
};

// Per-call retry bookkeeping; lives on the stack of one Execute call.
struct RetryContext {
  int attemptIndex = 0;
  int maxAttempts = 0;
  std::optional<std::string> lastError;
  bool slowNotified = false;
};

// Outcome of one Execute call, for callers and tests that need more than the
// payload.
struct RunReport {
  int attempts = 0;
  int watchdogCancels = 0;
  bool slowNotified = false;
  std::optional<std::string> lastError;
};

using SessionFactory = std::function<std::unique_ptr<Session>()>;

// Receives the 1-based number of the attempt about to start.
using RetryNotifier = std::function<void(int)>;

inline constexpr int kRetryNotifyTimeoutMs = 1500;
inline constexpr int kSlowNotifyTimeoutMs = 1500;

// Default RetryNotifier: "Reconnecting to TV... (attempt N/M)".
inline RetryNotifier MakeRetryNotifier(INotificationSink &sink,
                                       std::string title, int maxAttempts) {
  return [&sink, title = std::move(title), maxAttempts](int attempt) {
    sink.Notify({title,
                 "Reconnecting to TV... (attempt " + std::to_string(attempt) +
                     "/" + std::to_string(maxAttempts) + ")",
                 Urgency::low, kRetryNotifyTimeoutMs});
  };
}

// Orchestrator — runs one device operation with bounded retries.
// Threading model:
// - Attempts run strictly one after another on the calling thread; each gets
//   a fresh Session which is destroyed (and its connection closed) before the
//   backoff sleep
// - A Watchdog thread runs alongside for the whole call and is cancelled on
//   every return path
// - Only transient failures (see classify::IsRetryable) are retried; delays
//   grow linearly: base, 2*base, ...
// - Sole owner of user-facing notifications for the call: at most one
//   "Connecting" (watchdog), one "Reconnecting" per retry unless the watchdog
//   already spoke, and exactly one critical notification on final failure
// - Execute may be called from several threads at once; all per-call state is
//   on the caller's stack, and the factory, sink and sleeper must tolerate
//   concurrent use
class Orchestrator {
public:
  using Operation = std::function<CommandResult(Session &)>;

  Orchestrator(RetryPolicy policy, SessionFactory factory,
               INotificationSink &sink, std::string title = "LG TV",
               retry::Sleeper sleeper = retry::WaitSync)
      : policy_(policy), factory_(std::move(factory)), sink_(sink),
        title_(std::move(title)), sleeper_(std::move(sleeper)) {
    policy_.maxAttempts = std::max(1, policy_.maxAttempts);
  }

  // Payload on success, nullopt on failure (details went to the sink).
  std::optional<Payload> Execute(const Operation &operation,
                                 std::string_view errorMsg,
                                 const RetryNotifier &onRetry = {}) {
    auto result = ExecuteDetailed(operation, errorMsg, onRetry);
    if (result) {
      return std::move(*result);
    }
    return std::nullopt;
  }

  CommandResult ExecuteDetailed(const Operation &operation,
                                std::string_view errorMsg,
                                const RetryNotifier &onRetry = {},
                                RunReport *reportOut = nullptr) {
    RetryContext ctx{.maxAttempts = policy_.maxAttempts};
    const retry::LinearBackoff backoff{policy_.baseDelay};
    RunReport report;

    Watchdog watchdog(policy_.slowThreshold, [this] {
      sink_.Notify({title_, "Connecting to TV...", Urgency::low,
                    kSlowNotifyTimeoutMs});
    });
    watchdog.Arm();

    for (; ctx.attemptIndex < ctx.maxAttempts; ++ctx.attemptIndex) {
      ++report.attempts;
      auto result = RunAttempt(operation, ctx);
      if (result) {
        Finish(watchdog, ctx, report, reportOut);
        log::Info("orchestrator", "succeeded on attempt ",
                  ctx.attemptIndex + 1);
        return result;
      }
      if (!classify::ShouldRetry(ctx.lastError)) {
        log::Debug("orchestrator", "not retrying: ",
                   ctx.lastError.value_or("no error recorded"));
        break;
      }
      if (ctx.attemptIndex + 1 < ctx.maxAttempts) {
        ctx.slowNotified = watchdog.Fired();
        if (onRetry && !ctx.slowNotified) {
          onRetry(ctx.attemptIndex + 2);
        }
        const auto delay = backoff.After(ctx.attemptIndex);
        log::Info("orchestrator", "attempt ", ctx.attemptIndex + 1,
                  " failed (", *ctx.lastError, "), retrying in ",
                  delay.count(), " ms");
        sleeper_(delay);
      }
    }

    Finish(watchdog, ctx, report, reportOut);
    std::string message = ctx.lastError.value_or(std::string(errorMsg));
    log::Error("orchestrator", "giving up after ", report.attempts,
               " attempt(s): ", message);
    sink_.Notify({title_, message, Urgency::critical});
    return Failure(std::move(message));
  }

  // Report of the call that finished last, on any thread.
  RunReport LastReport() const {
    std::lock_guard<std::mutex> lock(report_mu_);
    return last_report_;
  }

  const RetryPolicy &Policy() const { return policy_; }

private:
  CommandResult RunAttempt(const Operation &operation, RetryContext &ctx) {
    try {
      std::unique_ptr<Session> session = factory_();
      if (!session) {
        ctx.lastError = "could not create session";
        return Failure(*ctx.lastError);
      }
      CommandResult result = operation(*session);
      if (!result) {
        ctx.lastError = session->Error();
      }
      return result;
    } catch (const std::exception &e) {
      ctx.lastError = e.what();
      return Failure(e.what());
    }
  }

  void Finish(Watchdog &watchdog, RetryContext &ctx, RunReport &report,
              RunReport *reportOut) {
    watchdog.Cancel();
    ctx.slowNotified = watchdog.Fired();
    report.watchdogCancels = watchdog.CancelCount();
    report.slowNotified = ctx.slowNotified;
    report.lastError = ctx.lastError;
    if (reportOut) {
      *reportOut = report;
    }
    std::lock_guard<std::mutex> lock(report_mu_);
    last_report_ = report;
  }

  RetryPolicy policy_;
  SessionFactory factory_;
  INotificationSink &sink_;
  std::string title_;
  retry::Sleeper sleeper_;
  mutable std::mutex report_mu_;
  RunReport last_report_;
};

} // namespace lgtv
