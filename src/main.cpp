#include "core/runner.hpp"
#include "logging/log.hpp"
#include "notify/notification_sink.hpp"
#include "notify/notify_send_sink.hpp"
#include "tv/commands.hpp"
#include <charconv>
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitConfig = 3;

struct Options {
  lgtv::RunOptions run;
  bool notify = true;
  bool verbose = false;
  std::vector<std::string> positional;
};

void PrintUsage() {
  std::cerr
      << "usage: lgtv [options] <command>\n"
         "commands:\n"
         "  get <category> <key>                 print a system setting\n"
         "  set <category> <key>=<value>...      change system settings\n"
         "  request <uri> [<json-payload>]       send a raw SSAP request\n"
         "options:\n"
         "  --config <path>          TV config (default "
         "~/.config/lgtv/config.json)\n"
         "  --tv <name>              TV entry to use (default $LGTV_NAME)\n"
         "  --attempts <n>           connection attempts (default 3)\n"
         "  --retry-delay-ms <ms>    base retry delay (default 500)\n"
         "  --connect-timeout-ms <ms> per-stage connect timeout (default "
         "3000)\n"
         "  --wait-ms <ms>           wait for the TV's answer (default 2000)\n"
         "  --slow-ms <ms>           'Connecting...' threshold (default "
         "1000)\n"
         "  --title <text>           notification title (default 'LG TV')\n"
         "  --no-notify              log notifications instead of showing "
         "them\n"
         "  -v, --verbose            debug logging\n";
}

std::optional<int> ParseInt(std::string_view s) {
  int value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc() || ptr != s.data() + s.size() || value < 0) {
    return std::nullopt;
  }
  return value;
}

std::optional<Options> ParseArgs(int argc, char **argv) {
  Options opt;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto next = [&]() -> std::optional<std::string> {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      return std::nullopt;
    };
    auto nextInt = [&]() -> std::optional<int> {
      auto v = next();
      if (!v)
        return std::nullopt;
      auto n = ParseInt(*v);
      if (!n)
        std::cerr << "invalid number for " << a << ": " << *v << "\n";
      return n;
    };

    if (a == "--config") {
      auto v = next();
      if (!v)
        return std::nullopt;
      opt.run.configPath = *v;
    } else if (a == "--tv") {
      auto v = next();
      if (!v)
        return std::nullopt;
      opt.run.tvName = *v;
    } else if (a == "--title") {
      auto v = next();
      if (!v)
        return std::nullopt;
      opt.run.title = *v;
    } else if (a == "--attempts") {
      auto n = nextInt();
      if (!n || *n == 0)
        return std::nullopt;
      opt.run.policy.maxAttempts = *n;
    } else if (a == "--retry-delay-ms") {
      auto n = nextInt();
      if (!n)
        return std::nullopt;
      opt.run.policy.baseDelay = std::chrono::milliseconds(*n);
    } else if (a == "--slow-ms") {
      auto n = nextInt();
      if (!n)
        return std::nullopt;
      opt.run.policy.slowThreshold = std::chrono::milliseconds(*n);
    } else if (a == "--connect-timeout-ms") {
      auto n = nextInt();
      if (!n)
        return std::nullopt;
      opt.run.session.connectTimeout = std::chrono::milliseconds(*n);
    } else if (a == "--wait-ms") {
      auto n = nextInt();
      if (!n)
        return std::nullopt;
      opt.run.session.responseTimeout = std::chrono::milliseconds(*n);
    } else if (a == "--no-notify") {
      opt.notify = false;
    } else if (a == "-v" || a == "--verbose") {
      opt.verbose = true;
    } else if (a == "-h" || a == "--help") {
      return std::nullopt;
    } else if (a.starts_with("-") && a.size() > 1) {
      std::cerr << "unknown option " << a << "\n";
      return std::nullopt;
    } else {
      opt.positional.push_back(std::move(a));
    }
  }
  return opt;
}

// "70" -> 70, "true" -> true, "cinema" -> "cinema"
nlohmann::json ParseValue(const std::string &text) {
  auto v = nlohmann::json::parse(text, nullptr, false);
  if (v.is_discarded()) {
    return text;
  }
  return v;
}

struct Job {
  lgtv::Orchestrator::Operation operation;
  std::string errorMsg;
};

std::optional<Job> BuildJob(const std::vector<std::string> &args) {
  if (args.empty()) {
    return std::nullopt;
  }
  const std::string &cmd = args[0];
  if (cmd == "get" && args.size() == 3) {
    return Job{lgtv::tv::GetSystemSetting(args[1], args[2]),
               "Failed to read " + args[2]};
  }
  if (cmd == "set" && args.size() >= 3) {
    nlohmann::json settings = nlohmann::json::object();
    for (std::size_t i = 2; i < args.size(); ++i) {
      auto eq = args[i].find('=');
      if (eq == std::string::npos || eq == 0) {
        std::cerr << "expected <key>=<value>, got '" << args[i] << "'\n";
        return std::nullopt;
      }
      settings[args[i].substr(0, eq)] = ParseValue(args[i].substr(eq + 1));
    }
    return Job{lgtv::tv::SetSystemSettings(args[1], std::move(settings)),
               "Failed to change " + args[1] + " settings"};
  }
  if (cmd == "request" && (args.size() == 2 || args.size() == 3)) {
    nlohmann::json payload = nlohmann::json::object();
    if (args.size() == 3) {
      payload = nlohmann::json::parse(args[2], nullptr, false);
      if (payload.is_discarded() || !payload.is_object()) {
        std::cerr << "payload must be a JSON object\n";
        return std::nullopt;
      }
    }
    return Job{lgtv::tv::SendRequest(
                   lgtv::tv::MakeRequest(args[1], std::move(payload))),
               "Request to " + args[1] + " failed"};
  }
  return std::nullopt;
}

} // namespace

int main(int argc, char **argv) {
  auto opt = ParseArgs(argc, argv);
  if (!opt) {
    PrintUsage();
    return kExitUsage;
  }
  lgtv::log::SetLevel(opt->verbose ? lgtv::log::Level::debug
                                   : lgtv::log::Level::warn);
  auto job = BuildJob(opt->positional);
  if (!job) {
    PrintUsage();
    return kExitUsage;
  }

  std::unique_ptr<lgtv::INotificationSink> sink;
  if (opt->notify) {
    sink = std::make_unique<lgtv::NotifySendSink>();
  } else {
    sink = std::make_unique<lgtv::LogNotificationSink>();
  }

  try {
    auto outcome = lgtv::Run(opt->run, *sink, job->operation, job->errorMsg);
    switch (outcome.status) {
    case lgtv::RunStatus::ok:
      std::cout << outcome.payload->dump() << "\n";
      return kExitOk;
    case lgtv::RunStatus::config_error:
      return kExitConfig;
    case lgtv::RunStatus::failed:
      return kExitFailed;
    }
  } catch (const std::exception &e) {
    std::cerr << "lgtv: " << e.what() << "\n";
  }
  return kExitFailed;
}
