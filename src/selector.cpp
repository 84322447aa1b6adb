#include "evmux/selector.hpp"

#include "evmux/log.hpp"

#include <string>
#include <utility>

namespace evmux {

expected<void, ErrorCode> Selector::register_fd(int fd, Interest interest, std::shared_ptr<Handler> handler) {
  if (!handler) {
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidState);
  }
  if (!table_.insert({fd, interest, std::move(handler)})) {
    return expected<void, ErrorCode>::error(ErrorCode::kDuplicateRegistration);
  }

  auto added = poller_.add(fd, interest);
  if (!added) {
    // Roll back so the table never holds an unwatched descriptor
    table_.erase(fd);
    return added;
  }
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> Selector::unregister_fd(int fd) {
  if (!table_.erase(fd)) {
    return expected<void, ErrorCode>::error(ErrorCode::kNotRegistered);
  }

  auto removed = poller_.remove(fd);
  if (!removed) {
    EVMUX_LOG_ERROR("Selector: fd " + std::to_string(fd) + " was registered but not watched");
    return removed;
  }
  return expected<void, ErrorCode>::success();
}

expected<std::vector<SelectedKey>, ErrorCode> Selector::select() {
  std::vector<SelectedKey> keys;

  ready_.clear();
  while (ready_.empty()) {
    auto waited = poller_.wait(ready_, -1);
    if (!waited) {
      return expected<std::vector<SelectedKey>, ErrorCode>::error(waited.get_error());
    }
    if (waited.value() == 0) {
      // Interrupted by a signal: let the caller re-check its state
      return expected<std::vector<SelectedKey>, ErrorCode>::success(std::move(keys));
    }
  }

  keys.reserve(ready_.size());
  for (const ReadyEvent& ev : ready_) {
    const Registration* reg = table_.find(ev.fd);
    if (reg != nullptr) {
      keys.push_back({ev.fd, ev.ready, reg->handler});
    }
  }
  return expected<std::vector<SelectedKey>, ErrorCode>::success(std::move(keys));
}

bool Selector::is_current(const SelectedKey& key) const {
  const Registration* reg = table_.find(key.fd);
  return reg != nullptr && reg->handler == key.handler;
}

}  // namespace evmux
