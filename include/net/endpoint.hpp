#pragma once

#include <boost/algorithm/string/predicate.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace lgtv {

// webOS exposes its SSAP websocket over TLS on this port.
inline constexpr std::string_view kDefaultSslPort = "3001";

struct Endpoint {
  std::string host;
  std::string port{kDefaultSslPort};
  std::string target = "/";

  std::string Url() const { return "wss://" + host + ":" + port + target; }
};

// Accepts "host", "host:port" or "wss://host[:port][/path]". A bare IPv6
// literal (more than one ':') is taken as the host. Returns nullopt for an
// empty host or a non-wss scheme.
inline std::optional<Endpoint> ParseEndpoint(std::string_view address) {
  std::string rest(address);
  if (rest.find("://") != std::string::npos) {
    if (!boost::algorithm::istarts_with(rest, "wss://")) {
      return std::nullopt;
    }
    rest = rest.substr(6);
  }
  Endpoint ep;
  auto slash = rest.find('/');
  if (slash != std::string::npos) {
    ep.target = rest.substr(slash);
    rest = rest.substr(0, slash);
  }
  auto colon = rest.find(':');
  if (colon != std::string::npos && colon == rest.rfind(':')) {
    ep.port = rest.substr(colon + 1);
    rest = rest.substr(0, colon);
    if (ep.port.empty()) {
      return std::nullopt;
    }
  }
  if (rest.empty()) {
    return std::nullopt;
  }
  ep.host = rest;
  return ep;
}

} // namespace lgtv
