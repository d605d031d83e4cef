#pragma once

#include "core/command.hpp"
#include "sessions/session.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

// namespace tv — SSAP requests used by the CLI, plus Orchestrator operations
// wrapping them.
namespace lgtv::tv {

inline constexpr const char *kGetSystemSettingsUri =
    "ssap://settings/getSystemSettings";
inline constexpr const char *kSetSystemSettingsUri =
    "ssap://settings/setSystemSettings";

inline Command MakeRequest(std::string uri, Payload payload = Payload::object(),
                           std::string id = "request_1") {
  return Command(std::move(id), std::move(uri), std::move(payload));
}

inline Command MakeGetSystemSetting(const std::string &category,
                                    const std::string &key) {
  return Command("get_1", kGetSystemSettingsUri,
                 {{"category", category}, {"keys", Payload::array({key})}});
}

// `settings` must be an object of key -> value.
inline Command MakeSetSystemSettings(const std::string &category,
                                     Payload settings) {
  return Command("set_1", kSetSystemSettingsUri,
                 {{"category", category}, {"settings", std::move(settings)}});
}

// Succeeds with the bare value of `key`. A response that lacks the key is a
// failure without a session error, so it is never retried.
inline auto GetSystemSetting(std::string category, std::string key) {
  return [category = std::move(category),
          key = std::move(key)](Session &session) -> CommandResult {
    auto result = session.Execute(MakeGetSystemSetting(category, key));
    if (!result) {
      return result;
    }
    auto settings = result->find("settings");
    if (settings == result->end() || !settings->is_object() ||
        !settings->contains(key)) {
      return Failure("setting '" + key + "' missing from response");
    }
    return (*settings)[key];
  };
}

inline auto SetSystemSettings(std::string category, Payload settings) {
  return [category = std::move(category),
          settings = std::move(settings)](Session &session) -> CommandResult {
    return session.Execute(MakeSetSystemSettings(category, settings));
  };
}

inline auto SendRequest(Command command) {
  return [command = std::move(command)](Session &session) -> CommandResult {
    return session.Execute(command);
  };
}

} // namespace lgtv::tv
