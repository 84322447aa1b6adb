#include "evmux/acceptor.hpp"

#include "evmux/connection.hpp"
#include "evmux/log.hpp"

#include <cerrno>
#include <cstring>

#include <exception>
#include <fcntl.h>
#include <memory>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace evmux {

Acceptor::Acceptor(sockpp::tcp_acceptor& listener, Selector& selector, const Callbacks& callbacks, LoopStats& stats,
                   const LoopConfig& config)
    : listener_(listener), selector_(selector), callbacks_(callbacks), stats_(stats), config_(config) {
  idle_fd_ = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (idle_fd_ < 0) {
    EVMUX_LOG_WARN(std::string("No spare descriptor for accept overload: ") + std::strerror(errno));
  }
}

Acceptor::~Acceptor() {
  if (idle_fd_ >= 0) {
    ::close(idle_fd_);
  }
}

bool Acceptor::drop_pending() {
  if (idle_fd_ < 0) {
    return false;
  }
  ::close(idle_fd_);
  int fd = ::accept(listener_.handle(), nullptr, nullptr);
  if (fd >= 0) {
    ::close(fd);
  }
  idle_fd_ = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (idle_fd_ < 0) {
    EVMUX_LOG_WARN(std::string("Spare descriptor not restored: ") + std::strerror(errno));
  }
  return fd >= 0;
}

void Acceptor::handle_ready(int fd, Interest ready) {
  (void)fd;
  (void)ready;
  // Every failure is counted and logged inside accept_one(); the listener stays registered
  auto accepted = accept_one();
  (void)accepted;
}

expected<ConnPtr, ErrorCode> Acceptor::accept_one() {
  sockpp::tcp_socket sock = listener_.accept();
  if (!sock) {
    int err = listener_.last_error();
    if (err == EAGAIN || err == EWOULDBLOCK) {
      stats_.spurious_accepts.fetch_add(1, std::memory_order_relaxed);
      EVMUX_LOG_DEBUG("Spurious accept wake-up");
      return expected<ConnPtr, ErrorCode>::error(ErrorCode::kWouldBlock);
    }
    stats_.accept_errors.fetch_add(1, std::memory_order_relaxed);
    if ((err == EMFILE || err == ENFILE) && drop_pending()) {
      // The pending client would otherwise keep the listener readable
      stats_.rejected_connections.fetch_add(1, std::memory_order_relaxed);
      EVMUX_LOG_WARN(std::string("Out of descriptors (") + std::strerror(err) + "), dropped a pending connection");
      return expected<ConnPtr, ErrorCode>::error(ErrorCode::kMaxConnectionsExceeded);
    }
    EVMUX_LOG_ERROR(std::string("Accept error: ") + std::strerror(err));
    return expected<ConnPtr, ErrorCode>::error(ErrorCode::kSocketError);
  }

  if (stats_.is_at_capacity(config_.max_connections)) {
    // Accept and close right away to drain the kernel queue
    stats_.rejected_connections.fetch_add(1, std::memory_order_relaxed);
    EVMUX_LOG_WARN("Max connections reached, rejecting " + PeerAddress::of(sock.handle()).to_string());
    sock.close();
    return expected<ConnPtr, ErrorCode>::error(ErrorCode::kMaxConnectionsExceeded);
  }

  if (!sock.set_non_blocking(true)) {
    stats_.accept_errors.fetch_add(1, std::memory_order_relaxed);
    EVMUX_LOG_ERROR("Failed to make accepted socket non-blocking: " + sock.last_error_str());
    return expected<ConnPtr, ErrorCode>::error(ErrorCode::kSocketError);
  }

  if (config_.tcp_nodelay) {
    int opt = 1;
    if (!sock.set_option(IPPROTO_TCP, TCP_NODELAY, opt)) {
      EVMUX_LOG_WARN("TCP_NODELAY not applied: " + sock.last_error_str());
    }
  }

  auto conn = std::make_shared<Connection>(std::move(sock), selector_, callbacks_, stats_, config_.read_chunk_size);

  auto registered = selector_.register_fd(conn->get_fd(), Interest::kReadable, conn);
  if (!registered) {
    stats_.accept_errors.fetch_add(1, std::memory_order_relaxed);
    EVMUX_LOG_ERROR("Failed to register fd " + std::to_string(conn->get_fd()) + " (" +
                    error_code_name(registered.get_error()) + ")");
    return expected<ConnPtr, ErrorCode>::error(registered.get_error());
  }

  stats_.total_connections.fetch_add(1, std::memory_order_relaxed);
  stats_.active_connections.fetch_add(1, std::memory_order_relaxed);

  const PeerAddress peer = conn->get_peer();
  EVMUX_LOG_INFO("Connected by " + peer.to_string() + " (fd " + std::to_string(conn->get_fd()) + ")");

  if (callbacks_.on_connect) {
    try {
      callbacks_.on_connect(conn, peer);
    } catch (const std::exception& e) {
      EVMUX_LOG_ERROR("on_connect failed for " + peer.to_string() + ": " + e.what());
      if (conn->get_state() == ConnectionState::kOpen) {
        conn->shutdown();
      }
    }
  }

  return expected<ConnPtr, ErrorCode>::success(conn);
}

}  // namespace evmux
