#include "evmux/event_loop.hpp"

#include "evmux/connection.hpp"
#include "evmux/log.hpp"

#include <cerrno>
#include <cstring>

#include <chrono>
#include <sockpp/inet_address.h>
#include <sockpp/socket.h>
#include <stdexcept>
#include <string>
#include <sys/eventfd.h>
#include <unistd.h>
#include <utility>

namespace evmux {

// ============================================================================
// WakeupHandler (drains the eventfd written by stop())
// ============================================================================

class EventLoop::WakeupHandler final : public Handler {
 public:
  void handle_ready(int fd, Interest ready) override {
    (void)ready;
    uint64_t count = 0;
    ssize_t n = ::read(fd, &count, sizeof(count));
    if (n < 0 && errno != EAGAIN && errno != EINTR) {
      EVMUX_LOG_ERROR(std::string("Wakeup read failed: ") + std::strerror(errno));
    }
  }

  HandlerKind kind() const override { return HandlerKind::kWakeup; }
};

// ============================================================================
// EventLoop
// ============================================================================

EventLoop::EventLoop(const LoopConfig& config, Callbacks callbacks)
    : config_(config), callbacks_(std::move(callbacks)) {
  // Ignores SIGPIPE so a write to a dead peer surfaces as EPIPE
  sockpp::initialize();

  sockpp::inet_address addr = config_.bind_addr.empty() ? sockpp::inet_address(config_.port)
                                                        : sockpp::inet_address(config_.bind_addr, config_.port);

  if (!listener_.open(addr, config_.backlog)) {
    EVMUX_THROW(std::runtime_error("Failed to listen on " + addr.to_string() + ": " + listener_.last_error_str()));
  }

  if (!listener_.set_non_blocking(true)) {
    EVMUX_THROW(std::runtime_error("Failed to make listener non-blocking: " + listener_.last_error_str()));
  }

  listen_fd_ = listener_.handle();
  listen_port_ = listener_.address().port();

  wakeup_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (wakeup_fd_ < 0) {
    EVMUX_THROW(std::runtime_error(std::string("eventfd failed: ") + std::strerror(errno)));
  }

  wakeup_ = std::make_shared<WakeupHandler>();
  acceptor_ = std::make_shared<Acceptor>(listener_, selector_, callbacks_, stats_, config_);

  if (!selector_.register_fd(wakeup_fd_, Interest::kReadable, wakeup_) ||
      !selector_.register_fd(listen_fd_, Interest::kReadable, acceptor_)) {
    ::close(wakeup_fd_);
    wakeup_fd_ = -1;
    EVMUX_THROW(std::runtime_error("Failed to register the listener"));
  }

  EVMUX_LOG_INFO("Listening on " + (config_.bind_addr.empty() ? std::string("*") : config_.bind_addr) + ":" +
                 std::to_string(listen_port_));
}

EventLoop::~EventLoop() {
  enter_stopped();
  if (wakeup_fd_ >= 0) {
    ::close(wakeup_fd_);
    wakeup_fd_ = -1;
  }
}

expected<void, ErrorCode> EventLoop::run() {
  if (get_state() == LoopState::kStopped) {
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidState);
  }

  ScopeGuard teardown([this]() { enter_stopped(); });
  EVMUX_LOG_INFO("Event loop running");

  while (!stop_requested()) {
    auto dispatched = run_once();
    if (!dispatched) {
      ErrorCode err = dispatched.get_error();
      EVMUX_LOG_ERROR(std::string("Event loop failed (") + error_code_name(err) +
                      "): " + std::strerror(selector_.last_poll_errno()));
      return expected<void, ErrorCode>::error(err);
    }
  }
  return expected<void, ErrorCode>::success();
}

expected<size_t, ErrorCode> EventLoop::run_once() {
  if (get_state() == LoopState::kStopped) {
    return expected<size_t, ErrorCode>::error(ErrorCode::kInvalidState);
  }

  EVMUX_LOG_DEBUG("Waiting for connections or data...");

  auto poll_start = std::chrono::steady_clock::now();
  auto selected = selector_.select();
  auto poll_end = std::chrono::steady_clock::now();
  stats_.record_poll_latency(static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(poll_end - poll_start).count()));

  if (!selected) {
    return expected<size_t, ErrorCode>::error(selected.get_error());
  }

  size_t dispatched = 0;
  for (const SelectedKey& key : selected.value()) {
    // An earlier handler in this batch may have released (and accept reused) key.fd
    if (!selector_.is_current(key)) {
      continue;
    }
    key.handler->handle_ready(key.fd, key.ready);
    if (key.handler->kind() != HandlerKind::kWakeup) {
      ++dispatched;
    }
  }
  return expected<size_t, ErrorCode>::success(dispatched);
}

void EventLoop::stop() noexcept {
  stop_requested_.store(true, std::memory_order_release);
  if (wakeup_fd_ >= 0) {
    uint64_t one = 1;
    ssize_t n = ::write(wakeup_fd_, &one, sizeof(one));
    (void)n;  // EAGAIN means a wakeup is already pending
  }
}

void EventLoop::enter_stopped() {
  if (get_state() == LoopState::kStopped) {
    return;
  }

  // Remaining clients leave through their own disconnect path
  for (const Registration& reg : selector_.registrations()) {
    if (reg.handler->kind() == HandlerKind::kConnection) {
      std::static_pointer_cast<Connection>(reg.handler)->shutdown();
    }
  }

  auto wakeup_removed = selector_.unregister_fd(wakeup_fd_);
  auto listener_removed = selector_.unregister_fd(listen_fd_);
  if (!wakeup_removed || !listener_removed) {
    EVMUX_LOG_ERROR("Event loop teardown found the listener or wakeup descriptor unregistered");
  }

  listener_.close();
  state_.store(LoopState::kStopped, std::memory_order_release);
  EVMUX_LOG_INFO("Event loop stopped (" + std::to_string(stats_.total_connections.load()) + " connections served)");
}

}  // namespace evmux
