#ifndef EVMUX_CONFIG_HPP_
#define EVMUX_CONFIG_HPP_

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>

#include <string>

namespace evmux {

// ============================================================================
// LoopConfig
// ============================================================================

struct LoopConfig {
  std::string bind_addr;          // Empty binds all interfaces
  uint16_t port = 0;              // 0 lets the kernel pick; see EventLoop::get_listen_port()
  int backlog = 128;              // listen() queue length
  size_t read_chunk_size = 1024;  // Bytes read per readable event
  size_t max_connections = 0;     // 0 = no cap beyond what poll() and the fd limit allow
  bool tcp_nodelay = false;       // Disable Nagle on accepted sockets

  LoopConfig& set_bind_addr(const std::string& addr) {
    bind_addr = addr;
    return *this;
  }

  LoopConfig& set_port(uint16_t p) {
    port = p;
    return *this;
  }

  LoopConfig& set_backlog(int n) {
    backlog = n;
    return *this;
  }

  LoopConfig& set_read_chunk_size(size_t n) {
    read_chunk_size = n;
    return *this;
  }

  LoopConfig& set_max_connections(size_t max) {
    max_connections = max;
    return *this;
  }

  LoopConfig& set_tcp_nodelay(bool enable) {
    tcp_nodelay = enable;
    return *this;
  }
};

// Parses a decimal TCP port (0..65535). Leaves *out untouched on failure.
inline bool parse_port(const char* text, uint16_t* out) {
  if (text == nullptr || *text == '\0' || *text == '-' || *text == '+') {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  unsigned long value = std::strtoul(text, &end, 10);
  if (errno != 0 || *end != '\0' || value > 65535) {
    return false;
  }
  *out = static_cast<uint16_t>(value);
  return true;
}

}  // namespace evmux

#endif  // EVMUX_CONFIG_HPP_
