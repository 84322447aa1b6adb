#ifndef EVMUX_SIGNAL_GUARD_HPP_
#define EVMUX_SIGNAL_GUARD_HPP_

#include <array>
#include <signal.h>
#include <string_view>

namespace evmux {

class EventLoop;  // Forward declaration

// ============================================================================
// StopSignalGuard (SIGINT / SIGTERM -> EventLoop::stop())
// ============================================================================

/**
 * @brief Routes SIGINT and SIGTERM to EventLoop::stop() for its lifetime.
 *
 * Installs the handlers without SA_RESTART so a blocked poll() returns with
 * EINTR; the wakeup descriptor written by stop() covers the case where the
 * signal lands on another thread. The previous actions are restored on
 * destruction. Only one guard may be active per process.
 */
class StopSignalGuard {
 public:
  // Throws std::system_error if sigaction fails or another guard is active.
  explicit StopSignalGuard(EventLoop& loop);
  ~StopSignalGuard() noexcept;

  StopSignalGuard(const StopSignalGuard&) = delete;
  StopSignalGuard& operator=(const StopSignalGuard&) = delete;

  // Last signal delivered while any guard was installed, 0 if none.
  static int last_signal() noexcept;

  static std::string_view signal_name(int signo) noexcept;

 private:
  static void on_signal(int signo) noexcept;

  static constexpr std::array<int, 2> kSignals = {SIGINT, SIGTERM};

  std::array<struct sigaction, kSignals.size()> old_actions_{};
};

}  // namespace evmux

#endif  // EVMUX_SIGNAL_GUARD_HPP_
