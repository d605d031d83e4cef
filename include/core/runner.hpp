#pragma once

#include "config/tv_config.hpp"
#include "core/orchestrator.hpp"
#include "logging/log.hpp"
#include "net/endpoint.hpp"
#include "net/transport.hpp"
#include "net/wss_transport.hpp"
#include "notify/notification_sink.hpp"
#include "sessions/session.hpp"
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Runner composition overview:
// - ConfigProvider: resolves address + client key; any failure is surfaced
//   once as a critical "Config error" notification and nothing is attempted
// - SessionFactory: binds endpoint, key and timeouts; builds a Session over a
//   fresh transport per attempt
// - Orchestrator: retries the operation, owns the Watchdog and all
//   notifications of the call
namespace lgtv {

struct RunOptions {
  std::optional<std::filesystem::path> configPath;
  std::optional<std::string> tvName;
  RetryPolicy policy;
  SessionOptions session;
  std::string title = "LG TV";
};

using TransportFactory = std::function<std::unique_ptr<ITransport>()>;

inline TransportFactory DefaultTransportFactory() {
  return [] { return std::make_unique<WssTransport>(); };
}

inline std::optional<TvConfig> LoadConfigOrNotify(const ConfigProvider &provider,
                                                  INotificationSink &sink,
                                                  const std::string &title) {
  auto cfg = provider.Load();
  if (!cfg) {
    log::Error("config", cfg.error().message);
    sink.Notify({title, "Config error: " + cfg.error().message,
                 Urgency::critical});
    return std::nullopt;
  }
  return std::move(*cfg);
}

inline std::optional<SessionFactory>
MakeSessionFactory(const TvConfig &tv, SessionOptions options,
                   TransportFactory transports) {
  auto endpoint = ParseEndpoint(tv.address);
  if (!endpoint) {
    return std::nullopt;
  }
  return SessionFactory(
      [endpoint = std::move(*endpoint), key = tv.clientKey,
       manifest = tv.manifest, options,
       transports = std::move(transports)]() {
        return std::make_unique<Session>(endpoint, key, transports(), options,
                                         manifest);
      });
}

enum class RunStatus { ok, failed, config_error };

struct RunOutcome {
  RunStatus status = RunStatus::failed;
  std::optional<Payload> payload;
};

// Loads config, then executes `operation` with retries. `errorMsg` is the
// final notification text when no error description was recorded.
inline RunOutcome Run(const RunOptions &opt, INotificationSink &sink,
                      const Orchestrator::Operation &operation,
                      std::string_view errorMsg,
                      TransportFactory transports = DefaultTransportFactory(),
                      retry::Sleeper sleeper = retry::WaitSync) {
  ConfigProvider provider(opt.configPath.value_or(DefaultConfigPath()),
                          opt.tvName);
  auto tv = LoadConfigOrNotify(provider, sink, opt.title);
  if (!tv) {
    return {RunStatus::config_error, std::nullopt};
  }
  auto factory = MakeSessionFactory(*tv, opt.session, std::move(transports));
  if (!factory) {
    const std::string msg = "invalid TV address '" + tv->address + "'";
    log::Error("config", msg);
    sink.Notify({opt.title, "Config error: " + msg, Urgency::critical});
    return {RunStatus::config_error, std::nullopt};
  }

  Orchestrator orchestrator(opt.policy, std::move(*factory), sink, opt.title,
                            std::move(sleeper));
  auto payload = orchestrator.Execute(
      operation, errorMsg,
      MakeRetryNotifier(sink, opt.title, orchestrator.Policy().maxAttempts));
  if (!payload) {
    return {RunStatus::failed, std::nullopt};
  }
  return {RunStatus::ok, std::move(payload)};
}

} // namespace lgtv
