// evmux load client
// Opens N concurrent connections, sends M messages on each and checks that
// every reply is the upper-cased message, in order.
//
// Usage: ./echo_load [num_clients] [messages_per_client] [port]
//   With no port (or 0) an in-process upper-echo loop is started.

#include "evmux.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

// ============================================================================
// Minimal blocking client
// ============================================================================

class LoadClient {
 public:
  ~LoadClient() { close_fd(); }

  bool connect(uint16_t port) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0) return false;

    int opt = 1;
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = inet_addr("127.0.0.1");

    if (::connect(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
      close_fd();
      return false;
    }
    return true;
  }

  bool send_all(const std::string& msg) {
    size_t sent = 0;
    while (sent < msg.size()) {
      ssize_t n = ::send(fd_, msg.data() + sent, msg.size() - sent, MSG_NOSIGNAL);
      if (n <= 0) return false;
      sent += static_cast<size_t>(n);
    }
    return true;
  }

  // Replies can arrive split; read until the expected length is in.
  bool recv_exact(std::string& out, size_t len) {
    out.resize(len);
    size_t got = 0;
    while (got < len) {
      ssize_t n = ::recv(fd_, &out[got], len - got, 0);
      if (n <= 0) return false;
      got += static_cast<size_t>(n);
    }
    return true;
  }

  void close_fd() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_ = -1;
};

// ============================================================================
// Load runner
// ============================================================================

struct LoadResult {
  uint64_t ok_replies = 0;
  uint64_t bad_replies = 0;
  int failed_clients = 0;
  double elapsed_sec = 0.0;
  double p50_us = 0.0;
  double p99_us = 0.0;
};

LoadResult run_load(uint16_t port, int num_clients, int msgs_per_client) {
  std::vector<std::vector<double>> latencies(num_clients);
  std::atomic<uint64_t> ok{0};
  std::atomic<uint64_t> bad{0};
  std::atomic<int> failed{0};
  std::atomic<int> ready_count{0};
  std::atomic<bool> go{false};

  std::vector<std::thread> threads;
  for (int c = 0; c < num_clients; ++c) {
    threads.emplace_back([&, c]() {
      LoadClient client;
      bool connected = client.connect(port);
      ++ready_count;
      if (!connected) {
        ++failed;
        return;
      }

      while (!go.load(std::memory_order_acquire)) std::this_thread::yield();

      std::string reply;
      latencies[c].reserve(msgs_per_client);
      for (int i = 0; i < msgs_per_client; ++i) {
        std::string msg = "client " + std::to_string(c) + " message " + std::to_string(i);
        auto t0 = std::chrono::steady_clock::now();
        if (!client.send_all(msg) || !client.recv_exact(reply, msg.size())) {
          ++failed;
          return;
        }
        auto t1 = std::chrono::steady_clock::now();
        latencies[c].push_back(std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count() / 1000.0);

        if (reply == evmux::to_upper_ascii(msg)) {
          ++ok;
        } else {
          ++bad;
        }
      }
    });
  }

  while (ready_count.load() < num_clients) std::this_thread::sleep_for(std::chrono::milliseconds(1));

  auto start = std::chrono::steady_clock::now();
  go.store(true, std::memory_order_release);
  for (auto& t : threads) t.join();
  auto end = std::chrono::steady_clock::now();

  std::vector<double> merged;
  for (auto& v : latencies) merged.insert(merged.end(), v.begin(), v.end());

  LoadResult result;
  result.ok_replies = ok.load();
  result.bad_replies = bad.load();
  result.failed_clients = failed.load();
  result.elapsed_sec = std::chrono::duration<double>(end - start).count();
  if (!merged.empty()) {
    std::sort(merged.begin(), merged.end());
    result.p50_us = merged[merged.size() * 50 / 100];
    result.p99_us = merged[merged.size() * 99 / 100];
  }
  return result;
}

int main(int argc, char* argv[]) {
  int num_clients = (argc > 1) ? atoi(argv[1]) : 100;
  int msgs_per_client = (argc > 2) ? atoi(argv[2]) : 100;
  uint16_t port = 0;
  if (argc > 3 && !evmux::parse_port(argv[3], &port)) {
    std::cerr << "Invalid port '" << argv[3] << "' (expected 0-65535)" << std::endl;
    return 1;
  }

  std::unique_ptr<evmux::EventLoop> loop;
  std::thread loop_thread;
  if (port == 0) {
    evmux::Logger::set_level(evmux::Logger::Level::kWarn);
    loop = std::make_unique<evmux::EventLoop>(evmux::LoopConfig().set_backlog(1024).set_tcp_nodelay(true),
                                              evmux::make_upper_echo_callbacks());
    port = loop->get_listen_port();
    loop_thread = std::thread([&]() {
      auto result = loop->run();
      if (!result) {
        std::cerr << "Loop failed: " << evmux::error_code_name(result.get_error()) << "\n";
      }
    });
  }

  std::cout << "evmux echo load\n";
  std::cout << "  Port:             " << port << "\n";
  std::cout << "  Clients:          " << num_clients << "\n";
  std::cout << "  Messages/client:  " << msgs_per_client << "\n";

  LoadResult r = run_load(port, num_clients, msgs_per_client);

  double throughput = r.elapsed_sec > 0 ? r.ok_replies / r.elapsed_sec : 0.0;
  std::cout << "\n=== Results ===\n";
  std::cout << "  Correct replies:  " << r.ok_replies << "\n";
  std::cout << "  Wrong replies:    " << r.bad_replies << "\n";
  std::cout << "  Failed clients:   " << r.failed_clients << "\n";
  std::cout << "  Elapsed:          " << r.elapsed_sec << " s\n";
  std::cout << "  Throughput:       " << static_cast<int>(throughput) << " msg/s\n";
  std::cout << "  Latency P50:      " << r.p50_us << " us\n";
  std::cout << "  Latency P99:      " << r.p99_us << " us\n";

  if (loop) {
    loop->stop();
    loop_thread.join();

    const auto& stats = loop->stats();
    std::cout << "\n=== Loop Stats ===\n";
    std::cout << "  Total connections:    " << stats.total_connections.load() << "\n";
    std::cout << "  Max poll latency:     " << stats.max_poll_latency_us.load() << " us\n";
    std::cout << "  Spurious accepts:     " << stats.spurious_accepts.load() << "\n";
    std::cout << "  Socket errors:        " << stats.socket_errors.load() << "\n";
  }

  uint64_t expected_replies = static_cast<uint64_t>(num_clients) * static_cast<uint64_t>(msgs_per_client);
  return (r.ok_replies == expected_replies) ? 0 : 1;
}
