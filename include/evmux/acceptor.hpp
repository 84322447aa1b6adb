#ifndef EVMUX_ACCEPTOR_HPP_
#define EVMUX_ACCEPTOR_HPP_

#include "callbacks.hpp"
#include "config.hpp"
#include "handler.hpp"
#include "loop_stats.hpp"
#include "selector.hpp"
#include "vocabulary.hpp"

#include <sockpp/tcp_acceptor.h>

namespace evmux {

// ============================================================================
// Acceptor (handler bound to the listening descriptor)
// ============================================================================

/**
 * @brief Accepts clients on the listening socket and registers them.
 *
 * Holds one spare descriptor (/dev/null). When accept() fails because the
 * process or system is out of descriptors, the spare is released long enough
 * to accept and close the pending connection, so a level-triggered listener
 * does not stay readable forever.
 */
class Acceptor : public Handler {
 public:
  Acceptor(sockpp::tcp_acceptor& listener, Selector& selector, const Callbacks& callbacks, LoopStats& stats,
           const LoopConfig& config);
  ~Acceptor() override;

  Acceptor(const Acceptor&) = delete;
  Acceptor& operator=(const Acceptor&) = delete;

  void handle_ready(int fd, Interest ready) override;
  HandlerKind kind() const override { return HandlerKind::kAcceptor; }

  // Performs one non-blocking accept and registers the new connection.
  // Returns error(kWouldBlock) when nothing was pending (spurious wake),
  // error(kMaxConnectionsExceeded) when the connection was turned away
  // (cap reached or out of descriptors), error(kSocketError) for any other
  // failure. None of these affect the
  // listener's own registration.
  expected<ConnPtr, ErrorCode> accept_one();

 private:
  // Accepts and closes one pending connection using the spare descriptor.
  bool drop_pending();

  sockpp::tcp_acceptor& listener_;
  Selector& selector_;
  const Callbacks& callbacks_;
  LoopStats& stats_;
  const LoopConfig& config_;
  int idle_fd_ = -1;
};

}  // namespace evmux

#endif  // EVMUX_ACCEPTOR_HPP_
