#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

namespace lgtv {

using Payload = nlohmann::json;

// Command — one SSAP request ({"type":"request","id","uri","payload"}).
// Built by the caller, never modified afterwards.
class Command {
public:
  Command(std::string id, std::string uri, Payload payload = Payload::object())
      : id_(std::move(id)), uri_(std::move(uri)), payload_(std::move(payload)) {
  }

  static constexpr const char *kKind = "request";

  const std::string &Id() const { return id_; }
  const std::string &Uri() const { return uri_; }
  const Payload &Body() const { return payload_; }

  nlohmann::json ToJson() const {
    return {{"type", kKind}, {"id", id_}, {"uri", uri_}, {"payload", payload_}};
  }

private:
  std::string id_;
  std::string uri_;
  Payload payload_;
};

// CommandResult — response payload on success, error description on failure.
using CommandResult = std::expected<Payload, std::string>;

inline CommandResult Failure(std::string description) {
  return std::unexpected(std::move(description));
}

} // namespace lgtv
