#ifndef EVMUX_CALLBACKS_HPP_
#define EVMUX_CALLBACKS_HPP_

#include <cstdint>

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace evmux {

class Connection;  // Forward declaration

using ConnPtr = std::shared_ptr<Connection>;

// ============================================================================
// PeerAddress
// ============================================================================

struct PeerAddress {
  std::string host;
  uint16_t port = 0;

  // Looks up the remote end of a connected socket. Returns an empty address
  // if the socket is no longer connected or is not an IP socket.
  static PeerAddress of(int fd);

  bool empty() const { return host.empty() && port == 0; }

  std::string to_string() const {
    if (empty()) {
      return "<unknown peer>";
    }
    if (host.find(':') != std::string::npos) {
      return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
  }
};

// ============================================================================
// Connection lifecycle callbacks (supplied by the protocol layer)
// ============================================================================

/**
 * All callbacks run synchronously on the event loop thread and must not block.
 * on_read returns true to keep the connection open, false to close it.
 */
struct Callbacks {
  std::function<void(const ConnPtr&, const PeerAddress&)> on_connect;
  std::function<bool(const ConnPtr&, const PeerAddress&, std::string_view)> on_read;
  std::function<void(const ConnPtr&, const PeerAddress&)> on_disconnect;
};

}  // namespace evmux

#endif  // EVMUX_CALLBACKS_HPP_
