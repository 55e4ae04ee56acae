// forced_exit.cpp

#include <pwr/error.hpp>
#include <pwr/forced_exit.hpp>
#include <pwr/log.hpp>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <initializer_list>

#include <signal.h>

namespace {
std::atomic_bool exit_requested(false);

static_assert(std::atomic_bool::is_always_lock_free,
              "flag is written from a signal handler");

void on_exit_signal(int) { exit_requested = true; }
} // namespace

namespace pwr::forced_exit {
void install() {
  struct sigaction sa = {};
  sa.sa_handler = on_exit_signal;
  sigemptyset(&sa.sa_mask);
  for (int sig : {SIGINT, SIGTERM, SIGUSR1}) {
    if (sigaction(sig, &sa, nullptr) == -1)
      throw exception(std::error_code(errno, std::system_category()),
                      "failed to install signal handler");
  }
  exit_requested = false;
  log::logline(log::debug, "installed exit signal handlers");
}

bool requested() noexcept { return exit_requested; }

void request() noexcept { exit_requested = true; }

void reset() noexcept { exit_requested = false; }
} // namespace pwr::forced_exit
