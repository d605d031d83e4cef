/*
===============================================================================
 Orchestrator — retry, backoff and notification behaviour
===============================================================================

Every attempt runs a real Session over a scripted transport, so the recorded
error is the one the session produced. The sleeper is replaced by a recorder;
no test sleeps for the backoff delays.

Covered:
- transient failures followed by success: attempt count, linear delays,
  payload, single watchdog cancel
- permanent failure: one attempt, no sleep, one critical notification
- exhausted retries: final message equals the last error text
- watchdog interplay with "Reconnecting" notifications
- local wait timeout, operation-level failures and exceptions are not retried
- a throwing session factory still ends in one critical notification
- concurrent callers on one Orchestrator get their own reports
===============================================================================
*/

#include <chrono>
#include <deque>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "common/mock_transport.hpp"
#include "common/recording_sink.hpp"
#include "common/test_check.hpp"
#include "core/orchestrator.hpp"
#include "tv/commands.hpp"

using namespace std::chrono_literals;
using lgtv::Urgency;

namespace {

constexpr const char *kSslEof = "SSL: UNEXPECTED_EOF_WHILE_READING";

// Hands one transport script to each new session, in order.
struct FakeTv {
  std::deque<test::TransportScript> attempts;
  std::shared_ptr<test::TransportLog> log =
      std::make_shared<test::TransportLog>();
  int sessionsCreated = 0;

  lgtv::SessionFactory Factory() {
    return [this] {
      ++sessionsCreated;
      test::TransportScript script;
      if (!attempts.empty()) {
        script = std::move(attempts.front());
        attempts.pop_front();
      }
      lgtv::SessionOptions options;
      options.responseTimeout = 100ms;
      return std::make_unique<lgtv::Session>(
          lgtv::Endpoint{"10.0.0.2"}, "KEY",
          test::MakeMockTransport(std::move(script), log), options);
    };
  }

  void FailConnect(const std::string &error) {
    test::TransportScript s;
    s.connectError = lgtv::TransportError{error};
    attempts.push_back(std::move(s));
  }

  void Respond(const std::string &payload) {
    test::TransportScript s;
    s.inbound = {test::Registered(), test::Response(payload)};
    attempts.push_back(std::move(s));
  }

  void Silent() { attempts.push_back(test::TransportScript{}); }
};

struct SleepRecorder {
  std::vector<std::chrono::milliseconds> delays;

  lgtv::retry::Sleeper Sleeper() {
    return [this](std::chrono::milliseconds d) { delays.push_back(d); };
  }
};

lgtv::RetryPolicy Policy(int attempts, std::chrono::milliseconds base = 500ms,
                         std::chrono::milliseconds slow = 10s) {
  lgtv::RetryPolicy p;
  p.maxAttempts = attempts;
  p.baseDelay = base;
  p.slowThreshold = slow;
  return p;
}

lgtv::Orchestrator::Operation GetBrightness() {
  return lgtv::tv::SendRequest(
      lgtv::tv::MakeGetSystemSetting("picture", "brightness"));
}

} // namespace

void test_scenario_two_ssl_failures_then_success() {
  std::cout << "[TEST] two SSL EOF failures, third attempt succeeds\n";
  FakeTv tv;
  tv.FailConnect(kSslEof);
  tv.FailConnect(kSslEof);
  tv.Respond(R"({"settings":{"brightness":70}})");
  SleepRecorder sleeps;
  test::RecordingSink sink;
  lgtv::Orchestrator orch(Policy(3, 500ms), tv.Factory(), sink, "TV Brightness",
                          sleeps.Sleeper());

  std::vector<int> retries;
  auto result = orch.Execute(GetBrightness(), "Failed to read brightness",
                             [&](int attempt) { retries.push_back(attempt); });

  TEST_CHECK(result.has_value());
  TEST_CHECK(*result == nlohmann::json::parse(R"({"settings":{"brightness":70}})"));
  TEST_CHECK(tv.sessionsCreated == 3);
  TEST_CHECK(sleeps.delays.size() == 2);
  TEST_CHECK(sleeps.delays[0] == 500ms);
  TEST_CHECK(sleeps.delays[1] == 1000ms);
  TEST_CHECK(retries == std::vector<int>({2, 3}));
  TEST_CHECK(orch.LastReport().attempts == 3);
  TEST_CHECK(orch.LastReport().watchdogCancels == 1);
  TEST_CHECK(sink.Count(Urgency::critical) == 0);
  // Every session closed its transport before the next one was created.
  TEST_CHECK(tv.log->connects == 3);
  TEST_CHECK(tv.log->closes == 3);
  std::cout << "[TEST] OK\n";
}

void test_transient_failures_then_success_property() {
  std::cout << "[TEST] M transient failures then success, M < max\n";
  constexpr int kMax = 5;
  for (int m = 0; m < kMax; ++m) {
    FakeTv tv;
    for (int i = 0; i < m; ++i) {
      tv.FailConnect(i % 2 ? "Connection reset by peer (read)"
                           : "connect timed out");
    }
    tv.Respond(R"({"returnValue":true,"m":)" + std::to_string(m) + "}");
    SleepRecorder sleeps;
    test::RecordingSink sink;
    lgtv::Orchestrator orch(Policy(kMax, 200ms), tv.Factory(), sink, "LG TV",
                            sleeps.Sleeper());

    auto result = orch.Execute(GetBrightness(), "failed");
    TEST_CHECK(result.has_value());
    TEST_CHECK((*result)["m"] == m);
    TEST_CHECK(tv.sessionsCreated == m + 1);
    TEST_CHECK(static_cast<int>(sleeps.delays.size()) == m);
    for (int i = 0; i < m; ++i) {
      TEST_CHECK(sleeps.delays[i] == 200ms * (i + 1));
    }
    TEST_CHECK(sink.All().empty());
  }
  std::cout << "[TEST] OK\n";
}

void test_permanent_failure_fails_fast() {
  std::cout << "[TEST] Invalid auth: one attempt, immediate critical\n";
  FakeTv tv;
  tv.Respond(R"({"returnValue":false,"errorText":"Invalid auth"})");
  tv.Respond(R"({"returnValue":true})");
  SleepRecorder sleeps;
  test::RecordingSink sink;
  lgtv::Orchestrator orch(Policy(3), tv.Factory(), sink, "LG TV",
                          sleeps.Sleeper());

  std::vector<int> retries;
  auto result = orch.Execute(GetBrightness(), "Failed to read brightness",
                             [&](int attempt) { retries.push_back(attempt); });

  TEST_CHECK(!result.has_value());
  TEST_CHECK(tv.sessionsCreated == 1);
  TEST_CHECK(sleeps.delays.empty());
  TEST_CHECK(retries.empty());
  auto all = sink.All();
  TEST_CHECK(all.size() == 1);
  TEST_CHECK(all[0].urgency == Urgency::critical);
  TEST_CHECK(all[0].message.find("Invalid auth") != std::string::npos);
  TEST_CHECK(orch.LastReport().watchdogCancels == 1);
  std::cout << "[TEST] OK\n";
}

void test_exhausted_retries_report_last_error() {
  std::cout << "[TEST] all attempts transient: final message is last error\n";
  FakeTv tv;
  tv.FailConnect("SSL: UNEXPECTED_MESSAGE (handshake)");
  tv.FailConnect("Connection refused (connect)");
  tv.FailConnect("EOF occurred in violation of protocol (handshake)");
  SleepRecorder sleeps;
  test::RecordingSink sink;
  lgtv::Orchestrator orch(Policy(3, 500ms), tv.Factory(), sink, "LG TV",
                          sleeps.Sleeper());

  auto detailed = orch.ExecuteDetailed(GetBrightness(), "Failed");
  TEST_CHECK(!detailed.has_value());
  TEST_CHECK(detailed.error() ==
             "EOF occurred in violation of protocol (handshake)");
  TEST_CHECK(tv.sessionsCreated == 3);
  TEST_CHECK(sleeps.delays ==
             std::vector<std::chrono::milliseconds>({500ms, 1000ms}));
  TEST_CHECK(sink.Count(Urgency::critical) == 1);
  auto all = sink.All();
  TEST_CHECK(all.back().message ==
             "EOF occurred in violation of protocol (handshake)");
  TEST_CHECK(orch.LastReport().watchdogCancels == 1);
  std::cout << "[TEST] OK\n";
}

void test_default_retry_notifier_without_watchdog() {
  std::cout << "[TEST] watchdog silent: one Reconnecting per retry\n";
  FakeTv tv;
  tv.FailConnect(kSslEof);
  tv.FailConnect(kSslEof);
  tv.FailConnect(kSslEof);
  SleepRecorder sleeps;
  test::RecordingSink sink;
  lgtv::Orchestrator orch(Policy(3, 500ms, 10s), tv.Factory(), sink, "LG TV",
                          sleeps.Sleeper());

  const auto started = std::chrono::steady_clock::now();
  auto result = orch.Execute(GetBrightness(), "Failed",
                             lgtv::MakeRetryNotifier(sink, "LG TV", 3));
  const auto elapsed = std::chrono::steady_clock::now() - started;

  TEST_CHECK(!result.has_value());
  TEST_CHECK(sink.CountContaining("Connecting to TV...") == 0);
  TEST_CHECK(sink.CountContaining("Reconnecting to TV...") == 2);
  TEST_CHECK(sink.CountContaining("(attempt 2/3)") == 1);
  TEST_CHECK(sink.CountContaining("(attempt 3/3)") == 1);
  TEST_CHECK(sink.Count(Urgency::critical) == 1);
  TEST_CHECK(!orch.LastReport().slowNotified);
  // Cancelling the 10 s watchdog must not wait for its threshold.
  TEST_CHECK(elapsed < 5s);
  std::cout << "[TEST] OK\n";
}

void test_watchdog_suppresses_reconnecting() {
  std::cout << "[TEST] watchdog fired: no Reconnecting notifications\n";
  FakeTv tv;
  tv.FailConnect(kSslEof);
  tv.FailConnect(kSslEof);
  tv.Respond(R"({"returnValue":true})");
  SleepRecorder sleeps;
  test::RecordingSink sink;
  lgtv::Orchestrator orch(Policy(3, 500ms, 20ms), tv.Factory(), sink, "LG TV",
                          sleeps.Sleeper());

  auto slowOperation = [](lgtv::Session &session) {
    std::this_thread::sleep_for(200ms);
    return session.Execute(
        lgtv::tv::MakeGetSystemSetting("picture", "brightness"));
  };
  auto result = orch.Execute(slowOperation, "Failed",
                             lgtv::MakeRetryNotifier(sink, "LG TV", 3));

  TEST_CHECK(result.has_value());
  TEST_CHECK(tv.sessionsCreated == 3);
  TEST_CHECK(sink.CountContaining("Connecting to TV...") == 1);
  TEST_CHECK(sink.CountContaining("Reconnecting") == 0);
  TEST_CHECK(sink.Count(Urgency::critical) == 0);
  TEST_CHECK(orch.LastReport().slowNotified);
  TEST_CHECK(orch.LastReport().watchdogCancels == 1);
  std::cout << "[TEST] OK\n";
}

void test_wait_timeout_not_retried() {
  std::cout << "[TEST] no answer within the wait bound is not retried\n";
  FakeTv tv;
  tv.Silent();
  tv.Respond(R"({"returnValue":true})");
  SleepRecorder sleeps;
  test::RecordingSink sink;
  lgtv::Orchestrator orch(Policy(3), tv.Factory(), sink, "LG TV",
                          sleeps.Sleeper());

  auto result = orch.Execute(GetBrightness(), "Failed");
  TEST_CHECK(!result.has_value());
  TEST_CHECK(tv.sessionsCreated == 1);
  TEST_CHECK(sleeps.delays.empty());
  TEST_CHECK(sink.CountContaining("No response from TV within 100 ms") == 1);
  std::cout << "[TEST] OK\n";
}

void test_operation_failure_without_session_error() {
  std::cout << "[TEST] operation-level failure uses the caller's message\n";
  FakeTv tv;
  tv.Respond(R"({"returnValue":true,"settings":{}})");
  SleepRecorder sleeps;
  test::RecordingSink sink;
  lgtv::Orchestrator orch(Policy(3), tv.Factory(), sink, "LG TV",
                          sleeps.Sleeper());

  auto result = orch.ExecuteDetailed(
      lgtv::tv::GetSystemSetting("picture", "brightness"),
      "Failed to read brightness");
  TEST_CHECK(!result.has_value());
  TEST_CHECK(result.error() == "Failed to read brightness");
  TEST_CHECK(tv.sessionsCreated == 1);
  auto all = sink.All();
  TEST_CHECK(all.size() == 1);
  TEST_CHECK(all[0].message == "Failed to read brightness");
  std::cout << "[TEST] OK\n";
}

void test_operation_exception_is_contained() {
  std::cout << "[TEST] exception from the operation ends the call cleanly\n";
  FakeTv tv;
  SleepRecorder sleeps;
  test::RecordingSink sink;
  lgtv::Orchestrator orch(Policy(3), tv.Factory(), sink, "LG TV",
                          sleeps.Sleeper());

  auto result = orch.Execute(
      [](lgtv::Session &) -> lgtv::CommandResult {
        throw std::runtime_error("boom");
      },
      "Failed");
  TEST_CHECK(!result.has_value());
  TEST_CHECK(tv.sessionsCreated == 1);
  TEST_CHECK(sink.CountContaining("boom") == 1);
  TEST_CHECK(orch.LastReport().watchdogCancels == 1);
  std::cout << "[TEST] OK\n";
}

void test_single_attempt_policy() {
  std::cout << "[TEST] maxAttempts=1: transient failure is final\n";
  FakeTv tv;
  tv.FailConnect(kSslEof);
  SleepRecorder sleeps;
  test::RecordingSink sink;
  lgtv::Orchestrator orch(Policy(1), tv.Factory(), sink, "LG TV",
                          sleeps.Sleeper());

  std::vector<int> retries;
  auto result = orch.Execute(GetBrightness(), "Failed",
                             [&](int attempt) { retries.push_back(attempt); });
  TEST_CHECK(!result.has_value());
  TEST_CHECK(retries.empty());
  TEST_CHECK(sleeps.delays.empty());
  TEST_CHECK(sink.CountContaining(kSslEof) == 1);
  std::cout << "[TEST] OK\n";
}

void test_independent_calls() {
  std::cout << "[TEST] retry state does not leak between calls\n";
  FakeTv tv;
  tv.FailConnect(kSslEof);
  tv.Respond(R"({"returnValue":true,"call":1})");
  tv.Respond(R"({"returnValue":true,"call":2})");
  SleepRecorder sleeps;
  test::RecordingSink sink;
  lgtv::Orchestrator orch(Policy(3), tv.Factory(), sink, "LG TV",
                          sleeps.Sleeper());

  auto first = orch.Execute(GetBrightness(), "Failed");
  TEST_CHECK(first.has_value() && (*first)["call"] == 1);
  TEST_CHECK(orch.LastReport().attempts == 2);
  auto second = orch.Execute(GetBrightness(), "Failed");
  TEST_CHECK(second.has_value() && (*second)["call"] == 2);
  TEST_CHECK(orch.LastReport().attempts == 1);
  TEST_CHECK(!orch.LastReport().lastError.has_value());
  std::cout << "[TEST] OK\n";
}

void test_factory_exception_is_contained() {
  std::cout << "[TEST] throwing session factory ends the call cleanly\n";
  SleepRecorder sleeps;
  test::RecordingSink sink;
  int calls = 0;
  lgtv::SessionFactory factory = [&calls]() -> std::unique_ptr<lgtv::Session> {
    ++calls;
    throw std::runtime_error("tls context unavailable");
  };
  lgtv::Orchestrator orch(Policy(3), factory, sink, "LG TV", sleeps.Sleeper());

  auto result = orch.ExecuteDetailed(GetBrightness(), "Failed");
  TEST_CHECK(!result.has_value());
  TEST_CHECK(result.error() == "tls context unavailable");
  TEST_CHECK(calls == 1);
  TEST_CHECK(sleeps.delays.empty());
  TEST_CHECK(sink.Count(Urgency::critical) == 1);
  TEST_CHECK(sink.CountContaining("tls context unavailable") == 1);
  TEST_CHECK(orch.LastReport().watchdogCancels == 1);
  std::cout << "[TEST] OK\n";
}

void test_concurrent_callers_keep_separate_reports() {
  std::cout << "[TEST] concurrent Execute calls do not share reports\n";
  test::RecordingSink sink;
  // The operations below never touch the network; each session gets a
  // private log so the two threads share nothing but the orchestrator.
  lgtv::SessionFactory factory = [] {
    return std::make_unique<lgtv::Session>(
        lgtv::Endpoint{"10.0.0.2"}, "KEY",
        test::MakeMockTransport(test::TransportScript{},
                                std::make_shared<test::TransportLog>()));
  };
  lgtv::Orchestrator orch(Policy(3, 1ms), factory, sink, "LG TV",
                          [](std::chrono::milliseconds d) {
                            std::this_thread::sleep_for(d);
                          });

  constexpr int kRounds = 20;
  lgtv::Orchestrator::Operation failing =
      [](lgtv::Session &) -> lgtv::CommandResult {
    throw std::runtime_error("Connection refused (connect)");
  };
  lgtv::Orchestrator::Operation succeeding = [](lgtv::Session &) {
    return lgtv::CommandResult(lgtv::Payload{{"returnValue", true}});
  };

  std::vector<lgtv::RunReport> failedReports(kRounds);
  std::vector<lgtv::RunReport> okReports(kRounds);
  {
    std::jthread a([&] {
      for (int i = 0; i < kRounds; ++i) {
        (void)orch.ExecuteDetailed(failing, "Failed", {}, &failedReports[i]);
      }
    });
    std::jthread b([&] {
      for (int i = 0; i < kRounds; ++i) {
        (void)orch.ExecuteDetailed(succeeding, "Failed", {}, &okReports[i]);
      }
    });
  }

  for (int i = 0; i < kRounds; ++i) {
    TEST_CHECK(okReports[i].attempts == 1);
    TEST_CHECK(okReports[i].watchdogCancels == 1);
    TEST_CHECK(!okReports[i].lastError.has_value());
    TEST_CHECK(failedReports[i].attempts == 3);
    TEST_CHECK(failedReports[i].watchdogCancels == 1);
    TEST_CHECK(failedReports[i].lastError == "Connection refused (connect)");
  }
  const int last = orch.LastReport().attempts;
  TEST_CHECK(last == 1 || last == 3);
  TEST_CHECK(sink.Count(Urgency::critical) == kRounds);
  std::cout << "[TEST] OK\n";
}

int main() {
  test_scenario_two_ssl_failures_then_success();
  test_transient_failures_then_success_property();
  test_permanent_failure_fails_fast();
  test_exhausted_retries_report_last_error();
  test_default_retry_notifier_without_watchdog();
  test_watchdog_suppresses_reconnecting();
  test_wait_timeout_not_retried();
  test_operation_failure_without_session_error();
  test_operation_exception_is_contained();
  test_single_attempt_policy();
  test_independent_calls();
  test_factory_exception_is_contained();
  test_concurrent_callers_keep_separate_reports();
  std::cout << "\n[TEST] ALL ORCHESTRATOR TESTS PASSED!\n";
  return 0;
}
