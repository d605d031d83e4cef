#pragma once

#include "logging/log.hpp"
#include "notify/notification_sink.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <signal.h>
#include <spawn.h>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

extern char **environ;

namespace lgtv {

// NotifySendSink — desktop notifications through `notify-send`.
// The child is spawned with posix_spawnp and reaped on the calling thread;
// a child that outlives the reap timeout (5 s by default) is killed so a
// wedged notification daemon cannot stall the caller.
class NotifySendSink : public INotificationSink {
public:
  static constexpr std::chrono::milliseconds kDefaultReapTimeout{5000};

  // How a delivery ended.
  enum class Delivery { not_started, exited, killed };

  explicit NotifySendSink(
      std::string program = "notify-send",
      std::chrono::milliseconds reapTimeout = kDefaultReapTimeout)
      : program_(std::move(program)), reap_timeout_(reapTimeout) {}

  void Notify(const Notification &n) noexcept override {
    try {
      (void)Deliver(n);
    } catch (const std::exception &e) {
      log::Warn("notify", "notification dropped: ", e.what());
    }
  }

  // Spawns the notifier and waits for it; the child is reaped on every path.
  Delivery Deliver(const Notification &n) const {
    return Spawn(BuildArgs(n));
  }

  std::vector<std::string> BuildArgs(const Notification &n) const {
    std::vector<std::string> args{program_,
                                  "-u",
                                  std::string(ToString(n.urgency)),
                                  "-t",
                                  std::to_string(n.timeoutMs)};
    if (n.icon) {
      args.push_back("-i");
      args.push_back(*n.icon);
    }
    args.push_back(n.title);
    args.push_back(n.message);
    return args;
  }

private:
  static constexpr std::chrono::milliseconds kReapPoll{20};

  Delivery Spawn(const std::vector<std::string> &args) const {
    std::vector<char *> argv;
    argv.reserve(args.size() + 1);
    for (const auto &a : args) {
      argv.push_back(const_cast<char *>(a.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = 0;
    const int rc =
        ::posix_spawnp(&pid, argv[0], nullptr, nullptr, argv.data(), environ);
    if (rc != 0) {
      log::Warn("notify", "cannot spawn ", program_, ": ", std::strerror(rc));
      return Delivery::not_started;
    }
    return Reap(pid);
  }

  Delivery Reap(pid_t pid) const {
    const auto deadline = std::chrono::steady_clock::now() + reap_timeout_;
    int status = 0;
    for (;;) {
      const pid_t r = ::waitpid(pid, &status, WNOHANG);
      if (r == pid) {
        if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
          log::Debug("notify", program_, " exited with ",
                     WEXITSTATUS(status));
        }
        return Delivery::exited;
      }
      if (r < 0 && errno != EINTR) {
        return Delivery::exited;
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        log::Warn("notify", program_, " did not exit in time, killing it");
        ::kill(pid, SIGKILL);
        (void)::waitpid(pid, &status, 0);
        return Delivery::killed;
      }
      std::this_thread::sleep_for(kReapPoll);
    }
  }

  std::string program_;
  std::chrono::milliseconds reap_timeout_;
};

} // namespace lgtv
