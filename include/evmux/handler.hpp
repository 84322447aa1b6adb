#ifndef EVMUX_HANDLER_HPP_
#define EVMUX_HANDLER_HPP_

#include "poller.hpp"

#include <cstdint>

namespace evmux {

enum class HandlerKind : uint8_t {
  kAcceptor,    // Bound to the listening descriptor
  kConnection,  // Bound to one accepted client descriptor
  kWakeup       // Loop-internal eventfd used by stop()
};

inline const char* handler_kind_name(HandlerKind kind) {
  switch (kind) {
    case HandlerKind::kAcceptor:
      return "acceptor";
    case HandlerKind::kConnection:
      return "connection";
    case HandlerKind::kWakeup:
      return "wakeup";
  }
  return "unknown";
}

// ============================================================================
// Handler (reacts to readiness of one registered descriptor)
// ============================================================================

class Handler {
 public:
  virtual ~Handler() = default;

  // Performs one unit of non-blocking work for a ready descriptor.
  // Only called from the event loop thread, and only while fd is registered.
  virtual void handle_ready(int fd, Interest ready) = 0;

  virtual HandlerKind kind() const = 0;
};

}  // namespace evmux

#endif  // EVMUX_HANDLER_HPP_
