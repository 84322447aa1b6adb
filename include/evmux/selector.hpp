#ifndef EVMUX_SELECTOR_HPP_
#define EVMUX_SELECTOR_HPP_

#include "handler.hpp"
#include "poller.hpp"
#include "registration_table.hpp"
#include "vocabulary.hpp"

#include <memory>
#include <vector>

namespace evmux {

// One ready descriptor together with the handler bound to it at poll time.
struct SelectedKey {
  int fd;
  Interest ready;
  std::shared_ptr<Handler> handler;
};

// ============================================================================
// Selector (registration table + readiness multiplexer)
// ============================================================================

/**
 * @brief Keeps the registration table and the poll set in lockstep.
 *
 * Every register/unregister mutates both structures in the same call, so
 * table membership always equals the watched set. Single-threaded: all calls
 * must come from the event loop thread.
 */
class Selector {
 public:
  Selector() = default;

  Selector(const Selector&) = delete;
  Selector& operator=(const Selector&) = delete;

  // Returns error(kDuplicateRegistration) if fd is already registered.
  expected<void, ErrorCode> register_fd(int fd, Interest interest, std::shared_ptr<Handler> handler);

  // Returns error(kNotRegistered) if fd is not registered.
  expected<void, ErrorCode> unregister_fd(int fd);

  // Blocks until at least one registered descriptor is ready and returns every
  // ready entry. An empty result means the wait was interrupted by a signal.
  // Returns error(kPollError) if the readiness primitive fails.
  expected<std::vector<SelectedKey>, ErrorCode> select();

  // True while key.fd is still bound to the same handler it was selected with.
  bool is_current(const SelectedKey& key) const;

  bool is_registered(int fd) const { return table_.contains(fd); }
  const Registration* find(int fd) const { return table_.find(fd); }
  size_t size() const { return table_.size(); }
  size_t watched_count() const { return poller_.size(); }
  std::vector<Registration> registrations() const { return table_.snapshot(); }

  int last_poll_errno() const { return poller_.last_errno(); }

 private:
  Poller poller_;
  RegistrationTable table_;
  std::vector<ReadyEvent> ready_;
};

}  // namespace evmux

#endif  // EVMUX_SELECTOR_HPP_
