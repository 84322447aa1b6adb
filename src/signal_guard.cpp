#include "evmux/signal_guard.hpp"

#include "evmux/event_loop.hpp"
#include "evmux/log.hpp"
#include "evmux/vocabulary.hpp"

#include <cerrno>
#include <csignal>
#include <cstddef>

#include <atomic>
#include <string>
#include <system_error>

namespace evmux {

namespace {

// Lock-free on every supported target, so safe to touch from the handler
std::atomic<EventLoop*> g_loop{nullptr};
volatile std::sig_atomic_t g_last_signal = 0;

}  // namespace

StopSignalGuard::StopSignalGuard(EventLoop& loop) {
  EventLoop* expected_loop = nullptr;
  if (!g_loop.compare_exchange_strong(expected_loop, &loop)) {
    EVMUX_THROW(std::system_error(EBUSY, std::generic_category(), "StopSignalGuard: another guard is active"));
  }

  struct sigaction sa {};
  sa.sa_handler = &StopSignalGuard::on_signal;
  ::sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;

  for (size_t i = 0; i < kSignals.size(); ++i) {
    if (::sigaction(kSignals[i], &sa, &old_actions_[i]) != 0) {
      int err = errno;
      for (size_t j = 0; j < i; ++j) {
        (void)::sigaction(kSignals[j], &old_actions_[j], nullptr);
      }
      g_loop.store(nullptr);
      EVMUX_THROW(std::system_error(err, std::generic_category(), "StopSignalGuard: sigaction failed"));
    }
  }

  EVMUX_LOG_DEBUG("Stop signals routed to the event loop");
}

StopSignalGuard::~StopSignalGuard() noexcept {
  for (size_t i = 0; i < kSignals.size(); ++i) {
    (void)::sigaction(kSignals[i], &old_actions_[i], nullptr);
  }
  g_loop.store(nullptr);
}

void StopSignalGuard::on_signal(int signo) noexcept {
  // No logging or allocation in here
  g_last_signal = signo;
  EventLoop* loop = g_loop.load();
  if (loop != nullptr) {
    loop->stop();
  }
}

int StopSignalGuard::last_signal() noexcept { return static_cast<int>(g_last_signal); }

std::string_view StopSignalGuard::signal_name(int signo) noexcept {
  switch (signo) {
    case SIGINT:
      return "SIGINT";
    case SIGTERM:
      return "SIGTERM";
    default:
      return "UNKNOWN";
  }
}

}  // namespace evmux
