#pragma once

#include "core/command.hpp"
#include "core/session_state.hpp"
#include "logging/log.hpp"
#include "net/endpoint.hpp"
#include "net/transport.hpp"
#include "sessions/register_payload.hpp"
#include "util/branch.hpp"
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace lgtv {

struct SessionOptions {
  // Bounds each network stage of the connect sequence.
  std::chrono::milliseconds connectTimeout{3000};
  // Bounds the wait for a terminal message once connected.
  std::chrono::milliseconds responseTimeout{2000};
};

// Session — one command over one connection.
// Threading model:
// - Entirely synchronous: Execute() connects, registers, sends and waits on
//   the calling thread; inbound frames are dispatched from inside
//   ITransport::Pump() to the per-type handlers registered in the constructor
// - Never reused: the first Execute() consumes the session; later calls fail
//   with "session already used" without touching the network
// - The transport is closed on every exit path of Execute()
class Session {
public:
  Session(Endpoint endpoint, std::string clientKey,
          std::unique_ptr<ITransport> transport, SessionOptions options = {},
          std::optional<nlohmann::json> manifest = std::nullopt)
      : endpoint_(std::move(endpoint)), client_key_(std::move(clientKey)),
        transport_(std::move(transport)), options_(options),
        manifest_(std::move(manifest)) {
    handlers_["registered"] = [this](const nlohmann::json &msg) {
      OnRegistered(msg);
    };
    handlers_["response"] = [this](const nlohmann::json &msg) {
      OnResponse(msg);
    };
    handlers_["error"] = [this](const nlohmann::json &msg) { OnError(msg); };
  }

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  // Never throws; every failure is returned as the error alternative.
  CommandResult Execute(const Command &command) {
    if (used_) {
      return Failure("session already used");
    }
    used_ = true;
    if (!transport_) {
      Fail("no transport");
      return Failure(*error_);
    }
    ScopedClose guard{*transport_};
    try {
      return Run(command);
    } catch (const std::exception &e) {
      Fail(e.what());
      return Failure(*error_);
    }
  }

  SessionState State() const { return state_; }

  // Description of the failure, set once the session reached Failed.
  const std::optional<std::string> &Error() const { return error_; }

private:
  struct ScopedClose {
    ITransport &transport;
    ~ScopedClose() { transport.Close(); }
  };

  CommandResult Run(const Command &command) {
    pending_ = command.ToJson().dump();
    Advance(SessionState::Connecting);
    transport_->SetMessageHandler(
        [this](std::string_view text) { OnMessage(text); });

    if (auto st = transport_->Connect(endpoint_, options_.connectTimeout);
        LGTV_UNLIKELY(!st)) {
      Fail(st.error().description);
      return Failure(*error_);
    }
    if (auto st = transport_->Send(
            MakeRegisterMessage(client_key_, manifest_).dump());
        LGTV_UNLIKELY(!st)) {
      Fail(st.error().description);
      return Failure(*error_);
    }

    const auto deadline =
        std::chrono::steady_clock::now() + options_.responseTimeout;
    while (!IsTerminal(state_)) {
      const auto remaining =
          std::chrono::duration_cast<std::chrono::milliseconds>(
              deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        Fail(WaitTimeoutText());
        break;
      }
      auto st = transport_->Pump(remaining);
      if (LGTV_UNLIKELY(!st)) {
        Fail(st.error().timedOut ? WaitTimeoutText() : st.error().description);
      }
    }

    if (state_ == SessionState::Done) {
      return std::move(result_);
    }
    return Failure(error_.value_or("Unknown error"));
  }

  void OnMessage(std::string_view text) {
    auto msg = nlohmann::json::parse(text, nullptr, false);
    if (LGTV_UNLIKELY(msg.is_discarded() || !msg.is_object())) {
      log::Warn("session", "ignoring malformed frame");
      return;
    }
    const std::string type = msg.value("type", "");
    auto it = handlers_.find(type);
    if (it == handlers_.end()) {
      log::Debug("session", "ignoring message of type '", type, "'");
      return;
    }
    if (IsTerminal(state_)) {
      log::Debug("session", "late '", type, "' after ", ToString(state_));
      return;
    }
    it->second(msg);
  }

  void OnRegistered(const nlohmann::json &) {
    if (!Advance(SessionState::Registered)) {
      return;
    }
    log::Debug("session", "registered, sending command");
    if (auto st = transport_->Send(pending_); LGTV_UNLIKELY(!st)) {
      Fail(st.error().description);
      return;
    }
    Advance(SessionState::AwaitingResponse);
  }

  void OnResponse(const nlohmann::json &msg) {
    nlohmann::json payload = msg.value("payload", nlohmann::json::object());
    auto rv = payload.find("returnValue");
    if (rv != payload.end() && rv->is_boolean() && !rv->get<bool>()) {
      Fail(TextField(payload, "errorText"));
      return;
    }
    result_ = std::move(payload);
    Advance(SessionState::Done);
  }

  void OnError(const nlohmann::json &msg) { Fail(TextField(msg, "error")); }

  bool Advance(SessionState next) {
    if (!CanAdvance(state_, next)) {
      log::Warn("session", "rejected transition ", ToString(state_), " -> ",
                ToString(next));
      return false;
    }
    state_ = next;
    return true;
  }

  void Fail(std::string description) {
    if (IsTerminal(state_)) {
      return;
    }
    log::Debug("session", "failed in ", ToString(state_), ": ", description);
    error_ = std::move(description);
    state_ = SessionState::Failed;
  }

  std::string WaitTimeoutText() const {
    return "No response from TV within " +
           std::to_string(options_.responseTimeout.count()) + " ms";
  }

  static std::string TextField(const nlohmann::json &obj, const char *key) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) {
      return it->get<std::string>();
    }
    return "Unknown error";
  }

  Endpoint endpoint_;
  std::string client_key_;
  std::unique_ptr<ITransport> transport_;
  SessionOptions options_;
  std::optional<nlohmann::json> manifest_;
  std::unordered_map<std::string, std::function<void(const nlohmann::json &)>>
      handlers_;
  SessionState state_ = SessionState::New;
  bool used_ = false;
  std::string pending_;
  Payload result_;
  std::optional<std::string> error_;
};

} // namespace lgtv
