#pragma once

#include "logging/log.hpp"
#include <array>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace lgtv {

struct TvConfig {
  std::string name;
  std::string address;
  std::string clientKey;
  std::optional<nlohmann::json> manifest;
};

enum class ConfigErrorKind { FileNotFound, Malformed, NotFound, Ambiguous };

struct ConfigError {
  ConfigErrorKind kind;
  std::string message;
};

// Names tried, in order, when the file lists several TVs and none was chosen.
inline constexpr std::array<std::string_view, 3> kFallbackTvNames = {
    "MyTV", "default", "LG TV"};

// $HOME/.config/lgtv/config.json
inline std::filesystem::path DefaultConfigPath() {
  const char *home = std::getenv("HOME");
  std::filesystem::path base = home ? home : ".";
  return base / ".config" / "lgtv" / "config.json";
}

// ConfigProvider — reads the TV table written by the pairing tool:
//   { "<name>": { "ip": "...", "key": "...", "manifest"?: {...} }, ... }
// Selection: an explicit name (argument, else $LGTV_NAME) must exist; a single
// entry is taken as is; otherwise the first fallback name present wins.
class ConfigProvider {
public:
  explicit ConfigProvider(std::filesystem::path path = DefaultConfigPath(),
                          std::optional<std::string> tvName = std::nullopt)
      : path_(std::move(path)), tv_name_(std::move(tvName)) {
    if (!tv_name_) {
      if (const char *env = std::getenv("LGTV_NAME"); env && *env) {
        tv_name_ = env;
      }
    }
  }

  std::expected<TvConfig, ConfigError> Load() const {
    std::ifstream in(path_);
    if (!in) {
      return std::unexpected(
          ConfigError{ConfigErrorKind::FileNotFound,
                      "config file not found: " + path_.string()});
    }
    auto doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
      return std::unexpected(
          ConfigError{ConfigErrorKind::Malformed,
                      "config file is not a JSON object: " + path_.string()});
    }
    auto selected = Select(doc);
    if (!selected) {
      return std::unexpected(selected.error());
    }
    return Parse(selected->first, *selected->second);
  }

  const std::filesystem::path &Path() const { return path_; }

private:
  using Entry = std::pair<std::string, const nlohmann::json *>;

  std::expected<Entry, ConfigError> Select(const nlohmann::json &doc) const {
    if (tv_name_) {
      auto it = doc.find(*tv_name_);
      if (it == doc.end()) {
        return std::unexpected(
            ConfigError{ConfigErrorKind::NotFound,
                        "TV '" + *tv_name_ + "' not found in config"});
      }
      return Entry{*tv_name_, &*it};
    }
    if (doc.size() == 1) {
      return Entry{doc.begin().key(), &doc.begin().value()};
    }
    for (std::string_view name : kFallbackTvNames) {
      auto it = doc.find(std::string(name));
      if (it != doc.end()) {
        return Entry{std::string(name), &*it};
      }
    }
    std::string names;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
      if (!names.empty()) {
        names += ", ";
      }
      names += it.key();
    }
    return std::unexpected(ConfigError{
        ConfigErrorKind::Ambiguous,
        "Multiple TVs found, set LGTV_NAME env var: [" + names + "]"});
  }

  static std::expected<TvConfig, ConfigError> Parse(const std::string &name,
                                                    const nlohmann::json &tv) {
    auto ip = tv.find("ip");
    auto key = tv.find("key");
    if (!tv.is_object() || ip == tv.end() || !ip->is_string() ||
        key == tv.end() || !key->is_string()) {
      return std::unexpected(
          ConfigError{ConfigErrorKind::Malformed,
                      "TV '" + name + "' needs string fields 'ip' and 'key'"});
    }
    TvConfig cfg{.name = name,
                 .address = ip->get<std::string>(),
                 .clientKey = key->get<std::string>()};
    if (auto m = tv.find("manifest"); m != tv.end() && m->is_object()) {
      cfg.manifest = *m;
    }
    log::Debug("config", "using TV '", name, "' at ", cfg.address);
    return cfg;
  }

  std::filesystem::path path_;
  std::optional<std::string> tv_name_;
};

} // namespace lgtv
