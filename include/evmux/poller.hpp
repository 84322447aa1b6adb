#ifndef EVMUX_POLLER_HPP_
#define EVMUX_POLLER_HPP_

#include "vocabulary.hpp"

#include <cstdint>

#include <poll.h>
#include <unordered_map>
#include <vector>

namespace evmux {

// ============================================================================
// Interest (readiness conditions a descriptor is watched for)
// ============================================================================

enum class Interest : uint8_t {
  kNone = 0,
  kReadable = 1 << 0,
  kWritable = 1 << 1,
};

constexpr Interest operator|(Interest a, Interest b) {
  return static_cast<Interest>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

constexpr Interest operator&(Interest a, Interest b) {
  return static_cast<Interest>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

constexpr bool has_interest(Interest mask, Interest flag) {
  return (mask & flag) != Interest::kNone;
}

struct ReadyEvent {
  int fd;
  Interest ready;
};

// ============================================================================
// Poller (poll() wrapper with O(1) add/remove)
// ============================================================================

/**
 * @brief Owns the pollfd array handed to poll().
 *
 * Removal swaps the last entry into the freed slot, so the array stays dense
 * and an fd -> slot index keeps add/remove O(1). The poller never owns or
 * closes the descriptors it watches.
 */
class Poller {
 public:
  Poller() = default;

  Poller(const Poller&) = delete;
  Poller& operator=(const Poller&) = delete;

  // Returns error(kDuplicateRegistration) if fd is already watched.
  expected<void, ErrorCode> add(int fd, Interest mask);

  // Returns error(kNotRegistered) if fd is not watched.
  expected<void, ErrorCode> remove(int fd);

  // Blocks for up to timeout_ms (-1 = forever) and appends the ready
  // descriptors to out. Returns the number appended; 0 on EINTR or timeout.
  // Returns error(kPollError) if poll() itself fails.
  expected<size_t, ErrorCode> wait(std::vector<ReadyEvent>& out, int timeout_ms);

  bool contains(int fd) const { return index_.find(fd) != index_.end(); }
  size_t size() const { return fds_.size(); }
  bool empty() const { return fds_.empty(); }

  // Errno of the most recent failed poll() call.
  int last_errno() const { return last_errno_; }

  static short to_poll_events(Interest mask);
  static Interest from_poll_revents(short revents);

 private:
  std::vector<pollfd> fds_;
  std::unordered_map<int, size_t> index_;
  int last_errno_ = 0;
};

}  // namespace evmux

#endif  // EVMUX_POLLER_HPP_
