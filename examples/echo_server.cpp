// Upper-case echo server.
//
// Usage: ./echo_server [port] [bind_addr]
//   EVMUX_LOG_LEVEL=debug|info|warn|error controls verbosity.
//   Send "close" to be disconnected; Ctrl-C stops the server.

#include "evmux.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

int main(int argc, char* argv[]) {
  uint16_t port = 50007;
  std::string bind_addr;

  if (argc > 1 && !evmux::parse_port(argv[1], &port)) {
    std::cerr << "Invalid port '" << argv[1] << "' (expected 0-65535)" << std::endl;
    return 1;
  }
  if (argc > 2) {
    bind_addr = argv[2];
  }

  if (const char* env = std::getenv("EVMUX_LOG_LEVEL")) {
    evmux::Logger::Level level;
    if (evmux::Logger::parse_level(env, &level)) {
      evmux::Logger::set_level(level);
    } else {
      std::cerr << "Ignoring unknown EVMUX_LOG_LEVEL '" << env << "'" << std::endl;
    }
  }

  try {
    evmux::Callbacks callbacks = evmux::make_upper_echo_callbacks();

    callbacks.on_connect = [](const evmux::ConnPtr& conn, const evmux::PeerAddress& peer) {
      std::cout << "Client #" << conn->get_id() << " connected from " << peer.to_string() << std::endl;
    };

    callbacks.on_disconnect = [](const evmux::ConnPtr& conn, const evmux::PeerAddress& peer) {
      std::cout << "Client #" << conn->get_id() << " (" << peer.to_string() << ") disconnected" << std::endl;
    };

    evmux::EventLoop loop(evmux::LoopConfig().set_bind_addr(bind_addr).set_port(port), std::move(callbacks));
    evmux::StopSignalGuard signals(loop);

    auto result = loop.run();

    int signo = evmux::StopSignalGuard::last_signal();
    if (signo != 0) {
      std::cout << "Stopped by " << evmux::StopSignalGuard::signal_name(signo) << std::endl;
    }

    const auto& stats = loop.stats();
    std::cout << "Served " << stats.total_connections.load() << " connections, " << stats.total_bytes_in.load()
              << " bytes in, " << stats.total_bytes_out.load() << " bytes out" << std::endl;

    if (!result) {
      std::cerr << "Server error: " << evmux::error_code_name(result.get_error()) << std::endl;
      return 1;
    }

  } catch (const std::exception& e) {
    std::cerr << "Server error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
