#ifndef EVMUX_CONNECTION_HPP_
#define EVMUX_CONNECTION_HPP_

#include "callbacks.hpp"
#include "handler.hpp"
#include "loop_stats.hpp"
#include "selector.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <memory>
#include <sockpp/tcp_socket.h>
#include <string_view>
#include <vector>

namespace evmux {

enum class ConnectionState : uint8_t {
  kOpen,     // Registered, dispatched on readability
  kClosing,  // Inside the disconnect path
  kClosed    // Unregistered and socket released
};

// ============================================================================
// Connection (handler bound to one accepted client descriptor)
// ============================================================================

/**
 * @brief Owns one client socket while it is registered with the selector.
 *
 * Each readable event performs a single non-blocking read and hands the bytes
 * to Callbacks::on_read. Peer shutdown, reset-class errors, a false return
 * from on_read or a failed send lead to the disconnect path, which runs
 * exactly once: on_disconnect, unregister, close.
 */
class Connection : public Handler, public std::enable_shared_from_this<Connection> {
 public:
  static constexpr size_t kDefaultReadChunkSize = 1024;

  Connection(sockpp::tcp_socket&& sock, Selector& selector, const Callbacks& callbacks, LoopStats& stats,
             size_t read_chunk_size = kDefaultReadChunkSize);
  ~Connection() override;

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // --- Handler ---

  void handle_ready(int fd, Interest ready) override;
  HandlerKind kind() const override { return HandlerKind::kConnection; }

  // --- User API ---

  // Writes all of data. Returns the byte count, or error(kWouldBlock) if the
  // socket buffer filled up, error(kConnectionReset) if the peer went away,
  // error(kSocketError) otherwise. Any failure closes the connection once the
  // current callback returns.
  expected<size_t, ErrorCode> send(std::string_view data);

  // Runs the disconnect path (loop teardown, protocol-initiated close).
  // Only valid while open; a call on a closed connection is counted in
  // LoopStats::late_dispatches.
  void shutdown();

  // --- Getters ---

  int get_fd() const { return fd_; }
  uint64_t get_id() const { return id_; }
  ConnectionState get_state() const { return state_; }
  bool is_closed() const { return state_ == ConnectionState::kClosed; }
  bool send_failed() const { return send_failed_; }

  // Queried from the OS on every call; empty once the connection is closed.
  PeerAddress get_peer() const;

  // Maps a socket errno to the read/write result taxonomy.
  static ErrorCode classify_errno(int err);

 private:
  // Single non-blocking read into read_buf_.
  // Returns the byte count, error(kWouldBlock), error(kConnectionClosed) on
  // orderly shutdown, error(kConnectionReset) or error(kSocketError).
  expected<size_t, ErrorCode> read_some();

  void disconnect(const PeerAddress& peer, ErrorCode reason);

  uint64_t id_;
  int fd_;
  sockpp::tcp_socket socket_;
  Selector& selector_;
  const Callbacks& callbacks_;
  LoopStats& stats_;

  std::vector<char> read_buf_;
  ConnectionState state_ = ConnectionState::kOpen;
  bool send_failed_ = false;
};

}  // namespace evmux

#endif  // EVMUX_CONNECTION_HPP_
