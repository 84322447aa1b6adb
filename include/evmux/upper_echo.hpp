#ifndef EVMUX_UPPER_ECHO_HPP_
#define EVMUX_UPPER_ECHO_HPP_

#include "callbacks.hpp"
#include "connection.hpp"
#include "log.hpp"

#include <string>
#include <string_view>

namespace evmux {

// ============================================================================
// Upper-case echo (sample protocol layer)
// ============================================================================

// A read chunk exactly equal to this asks the server to hang up.
constexpr std::string_view kCloseSentinel = "close";

// ASCII only; every other byte passes through unchanged.
inline std::string to_upper_ascii(std::string_view data) {
  std::string out(data);
  for (char& c : out) {
    if (c >= 'a' && c <= 'z') {
      c = static_cast<char>(c - 'a' + 'A');
    }
  }
  return out;
}

// Echoes each chunk back upper-cased. The sentinel gets no reply.
inline bool upper_echo(const ConnPtr& conn, const PeerAddress& peer, std::string_view data) {
  if (data == kCloseSentinel) {
    EVMUX_LOG_DEBUG("Close requested by " + peer.to_string());
    return false;
  }

  std::string reply = to_upper_ascii(data);
  EVMUX_LOG_DEBUG("Send: " + reply + " to: " + peer.to_string());
  auto sent = conn->send(reply);
  if (!sent) {
    EVMUX_LOG_DEBUG("Echo to " + peer.to_string() + " failed (" + error_code_name(sent.get_error()) + ")");
    return false;
  }
  return true;
}

inline Callbacks make_upper_echo_callbacks() {
  Callbacks callbacks;
  callbacks.on_read = &upper_echo;
  return callbacks;
}

}  // namespace evmux

#endif  // EVMUX_UPPER_ECHO_HPP_
