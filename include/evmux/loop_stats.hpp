#ifndef EVMUX_LOOP_STATS_HPP_
#define EVMUX_LOOP_STATS_HPP_

#include <cstdint>

#include <atomic>

namespace evmux {

// ============================================================================
// LoopStats - Atomic counters, written by the loop thread, readable anywhere
// ============================================================================

struct LoopStats {
  // Connection counters
  std::atomic<uint64_t> total_connections{0};
  std::atomic<uint64_t> active_connections{0};
  std::atomic<uint64_t> rejected_connections{0};
  std::atomic<uint64_t> disconnects{0};

  // Accept path
  std::atomic<uint64_t> spurious_accepts{0};
  std::atomic<uint64_t> accept_errors{0};

  // Throughput counters
  std::atomic<uint64_t> total_reads{0};
  std::atomic<uint64_t> total_bytes_in{0};
  std::atomic<uint64_t> total_bytes_out{0};

  // Error counters
  std::atomic<uint64_t> socket_errors{0};
  // Dispatch or disconnect reaching an already closed connection; stays 0
  std::atomic<uint64_t> late_dispatches{0};

  // Latency tracking (microseconds spent blocked in poll)
  std::atomic<uint64_t> last_poll_latency_us{0};
  std::atomic<uint64_t> max_poll_latency_us{0};

  // active_connections is a gauge of live clients and is left as is
  void reset() {
    total_connections = 0;
    rejected_connections = 0;
    disconnects = 0;
    spurious_accepts = 0;
    accept_errors = 0;
    total_reads = 0;
    total_bytes_in = 0;
    total_bytes_out = 0;
    socket_errors = 0;
    late_dispatches = 0;
    last_poll_latency_us = 0;
    max_poll_latency_us = 0;
  }

  void record_poll_latency(uint64_t us) {
    last_poll_latency_us.store(us, std::memory_order_relaxed);
    if (us > max_poll_latency_us.load(std::memory_order_relaxed)) {
      max_poll_latency_us.store(us, std::memory_order_relaxed);
    }
  }

  // max_connections == 0 means no cap
  bool is_at_capacity(uint64_t max_connections) const {
    return max_connections != 0 && active_connections.load(std::memory_order_relaxed) >= max_connections;
  }
};

}  // namespace evmux

#endif  // EVMUX_LOOP_STATS_HPP_
