#include "evmux/connection.hpp"

#include "evmux/log.hpp"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <atomic>
#include <exception>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <utility>

namespace evmux {

static std::atomic<uint64_t> g_next_conn_id{1};

PeerAddress PeerAddress::of(int fd) {
  struct sockaddr_storage ss;
  std::memset(&ss, 0, sizeof(ss));
  socklen_t len = sizeof(ss);
  if (::getpeername(fd, reinterpret_cast<struct sockaddr*>(&ss), &len) < 0) {
    return {};
  }

  char host[INET6_ADDRSTRLEN] = {};
  if (ss.ss_family == AF_INET) {
    const auto* sin = reinterpret_cast<const struct sockaddr_in*>(&ss);
    if (::inet_ntop(AF_INET, &sin->sin_addr, host, sizeof(host)) == nullptr) {
      return {};
    }
    return {host, ntohs(sin->sin_port)};
  }
  if (ss.ss_family == AF_INET6) {
    const auto* sin6 = reinterpret_cast<const struct sockaddr_in6*>(&ss);
    if (::inet_ntop(AF_INET6, &sin6->sin6_addr, host, sizeof(host)) == nullptr) {
      return {};
    }
    return {host, ntohs(sin6->sin6_port)};
  }
  return {};
}

Connection::Connection(sockpp::tcp_socket&& sock, Selector& selector, const Callbacks& callbacks, LoopStats& stats,
                       size_t read_chunk_size)
    : id_(g_next_conn_id.fetch_add(1, std::memory_order_relaxed)),
      fd_(sock.handle()),
      socket_(std::move(sock)),
      selector_(selector),
      callbacks_(callbacks),
      stats_(stats),
      read_buf_(read_chunk_size > 0 ? read_chunk_size : kDefaultReadChunkSize) {}

Connection::~Connection() {
  // Only reached with an open socket if registration never happened
  if (socket_.is_open()) {
    socket_.close();
  }
}

PeerAddress Connection::get_peer() const {
  if (state_ == ConnectionState::kClosed) {
    return {};
  }
  return PeerAddress::of(fd_);
}

ErrorCode Connection::classify_errno(int err) {
  switch (err) {
    case EAGAIN:
#if EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
    case EINTR:
      return ErrorCode::kWouldBlock;
    case ECONNRESET:
    case EPIPE:
    case ECONNABORTED:
    case ETIMEDOUT:
    case ENOTCONN:
    case ESHUTDOWN:
      return ErrorCode::kConnectionReset;
    default:
      return ErrorCode::kSocketError;
  }
}

expected<size_t, ErrorCode> Connection::read_some() {
  ssize_t n = socket_.read(read_buf_.data(), read_buf_.size());
  if (n > 0) {
    return expected<size_t, ErrorCode>::success(static_cast<size_t>(n));
  }
  if (n == 0) {
    return expected<size_t, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }
  return expected<size_t, ErrorCode>::error(classify_errno(errno));
}

void Connection::handle_ready(int fd, Interest ready) {
  (void)ready;
  EVMUX_ASSERT(fd == fd_);
  EVMUX_ASSERT(state_ == ConnectionState::kOpen);
  if (state_ != ConnectionState::kOpen) {
    stats_.late_dispatches.fetch_add(1, std::memory_order_relaxed);
    EVMUX_LOG_ERROR("Dispatch to connection #" + std::to_string(id_) + " (fd " + std::to_string(fd) +
                    ") after disconnect");
    return;
  }

  // Keeps this object alive across unregister_fd()
  ConnPtr self = shared_from_this();
  const PeerAddress peer = PeerAddress::of(fd_);

  auto read_result = read_some();
  if (!read_result.has_value()) {
    ErrorCode err = read_result.get_error();
    if (err == ErrorCode::kWouldBlock) {
      return;
    }
    if (err == ErrorCode::kSocketError) {
      stats_.socket_errors.fetch_add(1, std::memory_order_relaxed);
    }
    disconnect(peer, err);
    return;
  }

  const size_t n = read_result.value();
  stats_.total_reads.fetch_add(1, std::memory_order_relaxed);
  stats_.total_bytes_in.fetch_add(n, std::memory_order_relaxed);
  EVMUX_LOG_DEBUG("Received " + std::to_string(n) + " bytes from " + peer.to_string());

  bool keep_open = false;
  if (callbacks_.on_read) {
    try {
      keep_open = callbacks_.on_read(self, peer, std::string_view(read_buf_.data(), n));
    } catch (const std::exception& e) {
      EVMUX_LOG_ERROR("on_read failed for " + peer.to_string() + ": " + e.what());
      keep_open = false;
    }
  }

  if (state_ != ConnectionState::kOpen) {
    return;  // on_read called shutdown()
  }
  if (send_failed_) {
    disconnect(peer, ErrorCode::kConnectionReset);
  } else if (!keep_open) {
    disconnect(peer, ErrorCode::kOk);
  }
}

expected<size_t, ErrorCode> Connection::send(std::string_view data) {
  if (state_ != ConnectionState::kOpen || send_failed_) {
    return expected<size_t, ErrorCode>::error(ErrorCode::kInvalidState);
  }

  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = socket_.write(data.data() + sent, data.size() - sent);
    if (n > 0) {
      sent += static_cast<size_t>(n);
      continue;
    }

    int err = errno;
    if (n < 0 && err == EINTR) {
      continue;
    }

    ErrorCode code = n < 0 ? classify_errno(err) : ErrorCode::kSocketError;
    send_failed_ = true;
    if (code == ErrorCode::kWouldBlock) {
      EVMUX_LOG_WARN("Send buffer full on connection #" + std::to_string(id_) + ", dropping it");
    } else if (code == ErrorCode::kSocketError) {
      stats_.socket_errors.fetch_add(1, std::memory_order_relaxed);
      EVMUX_LOG_ERROR("Write error on connection #" + std::to_string(id_) + ": " + std::strerror(err));
    }
    stats_.total_bytes_out.fetch_add(sent, std::memory_order_relaxed);
    return expected<size_t, ErrorCode>::error(code);
  }

  stats_.total_bytes_out.fetch_add(sent, std::memory_order_relaxed);
  return expected<size_t, ErrorCode>::success(sent);
}

void Connection::shutdown() {
  if (state_ != ConnectionState::kOpen) {
    stats_.late_dispatches.fetch_add(1, std::memory_order_relaxed);
    EVMUX_LOG_ERROR("Shutdown of connection #" + std::to_string(id_) + " after disconnect");
    return;
  }
  ConnPtr self = shared_from_this();
  disconnect(PeerAddress::of(fd_), ErrorCode::kOk);
}

void Connection::disconnect(const PeerAddress& peer, ErrorCode reason) {
  EVMUX_ASSERT(state_ == ConnectionState::kOpen);
  state_ = ConnectionState::kClosing;

  switch (reason) {
    case ErrorCode::kConnectionClosed:
      EVMUX_LOG_INFO("Disconnected by " + peer.to_string());
      break;
    case ErrorCode::kConnectionReset:
      EVMUX_LOG_WARN("Connection to " + peer.to_string() + " reset");
      break;
    case ErrorCode::kOk:
      EVMUX_LOG_INFO("Closing connection to " + peer.to_string());
      break;
    default:
      EVMUX_LOG_ERROR("Dropping connection to " + peer.to_string() + " (" + error_code_name(reason) + ")");
      break;
  }

  if (callbacks_.on_disconnect) {
    try {
      callbacks_.on_disconnect(shared_from_this(), peer);
    } catch (const std::exception& e) {
      EVMUX_LOG_ERROR("on_disconnect failed for " + peer.to_string() + ": " + e.what());
    }
  }

  auto unregistered = selector_.unregister_fd(fd_);
  if (!unregistered) {
    EVMUX_LOG_ERROR("Connection #" + std::to_string(id_) + ": unregister fd " + std::to_string(fd_) +
                    " failed (" + error_code_name(unregistered.get_error()) + ")");
  }

  socket_.close();
  state_ = ConnectionState::kClosed;

  stats_.disconnects.fetch_add(1, std::memory_order_relaxed);
  stats_.active_connections.fetch_sub(1, std::memory_order_relaxed);
}

}  // namespace evmux
