#ifndef EVMUX_EVENT_LOOP_HPP_
#define EVMUX_EVENT_LOOP_HPP_

#include "acceptor.hpp"
#include "callbacks.hpp"
#include "config.hpp"
#include "loop_stats.hpp"
#include "selector.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <memory>
#include <sockpp/tcp_acceptor.h>

namespace evmux {

enum class LoopState : uint8_t {
  kRunning,  // Listener bound and registered
  kStopped   // Terminal: listener closed
};

// ============================================================================
// EventLoop (Reactor: one listener, many connections, one thread)
// ============================================================================

/**
 * @brief Owns the listening socket, the selector and every registered handler.
 *
 * The constructor binds and registers the listener (state kRunning). run()
 * blocks in the selector and dispatches each ready descriptor to its handler
 * until stop() is called or the readiness primitive fails. Leaving run(),
 * or destroying a loop that never ran, disconnects the remaining clients and
 * closes the listener last (state kStopped).
 */
class EventLoop {
 public:
  // Throws std::runtime_error if the listener or wakeup descriptor cannot be set up.
  explicit EventLoop(const LoopConfig& config, Callbacks callbacks = {});
  ~EventLoop();

  EventLoop(const EventLoop&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  // Start the loop (blocking). Returns success() after stop(), or the fatal
  // error (kPollError) if the readiness primitive failed.
  expected<void, ErrorCode> run();

  // One wait + dispatch cycle. Returns the number of handlers invoked;
  // 0 when the wait was interrupted or only woken by stop().
  expected<size_t, ErrorCode> run_once();

  // Request the loop to stop. Async-signal-safe and callable from any thread.
  void stop() noexcept;

  LoopState get_state() const { return state_.load(std::memory_order_acquire); }
  bool stop_requested() const { return stop_requested_.load(std::memory_order_acquire); }

  uint16_t get_listen_port() const { return listen_port_; }
  int get_listen_fd() const { return listen_fd_; }

  // Loop-thread only (or after run() has returned).
  const Selector& selector() const { return selector_; }

  size_t get_connection_count() const {
    return static_cast<size_t>(stats_.active_connections.load(std::memory_order_relaxed));
  }

  const LoopConfig& config() const { return config_; }

  // Performance monitoring
  const LoopStats& stats() const { return stats_; }
  void reset_stats() { stats_.reset(); }

 private:
  class WakeupHandler;

  void enter_stopped();

  LoopConfig config_;
  Callbacks callbacks_;
  LoopStats stats_;

  sockpp::tcp_acceptor listener_;
  Selector selector_;
  std::shared_ptr<Acceptor> acceptor_;
  std::shared_ptr<WakeupHandler> wakeup_;

  int listen_fd_ = -1;
  int wakeup_fd_ = -1;
  uint16_t listen_port_ = 0;

  std::atomic<bool> stop_requested_{false};
  std::atomic<LoopState> state_{LoopState::kRunning};
};

}  // namespace evmux

#endif  // EVMUX_EVENT_LOOP_HPP_
