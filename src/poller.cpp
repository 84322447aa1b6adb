#include "evmux/poller.hpp"

#include <cerrno>

namespace evmux {

short Poller::to_poll_events(Interest mask) {
  short events = 0;
  if (has_interest(mask, Interest::kReadable)) {
    events |= POLLIN;
  }
  if (has_interest(mask, Interest::kWritable)) {
    events |= POLLOUT;
  }
  return events;
}

Interest Poller::from_poll_revents(short revents) {
  Interest ready = Interest::kNone;
  // Error and hangup conditions surface as readable so the read path classifies them
  if (revents & (POLLIN | POLLPRI | POLLERR | POLLHUP | POLLNVAL)) {
    ready = ready | Interest::kReadable;
  }
  if (revents & POLLOUT) {
    ready = ready | Interest::kWritable;
  }
  return ready;
}

expected<void, ErrorCode> Poller::add(int fd, Interest mask) {
  if (contains(fd)) {
    return expected<void, ErrorCode>::error(ErrorCode::kDuplicateRegistration);
  }
  index_.emplace(fd, fds_.size());
  fds_.push_back({fd, to_poll_events(mask), 0});
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> Poller::remove(int fd) {
  auto it = index_.find(fd);
  if (it == index_.end()) {
    return expected<void, ErrorCode>::error(ErrorCode::kNotRegistered);
  }

  // Swap-and-pop keeps the pollfd array dense
  const size_t slot = it->second;
  const size_t last = fds_.size() - 1;
  if (slot != last) {
    fds_[slot] = fds_[last];
    index_[fds_[slot].fd] = slot;
  }
  fds_.pop_back();
  index_.erase(it);
  return expected<void, ErrorCode>::success();
}

expected<size_t, ErrorCode> Poller::wait(std::vector<ReadyEvent>& out, int timeout_ms) {
  int ret = ::poll(fds_.data(), static_cast<nfds_t>(fds_.size()), timeout_ms);
  if (ret < 0) {
    if (errno == EINTR) {
      return expected<size_t, ErrorCode>::success(0);
    }
    last_errno_ = errno;
    return expected<size_t, ErrorCode>::error(ErrorCode::kPollError);
  }

  size_t appended = 0;
  for (size_t i = 0; i < fds_.size() && appended < static_cast<size_t>(ret); ++i) {
    if (fds_[i].revents == 0) {
      continue;
    }
    Interest ready = from_poll_revents(fds_[i].revents);
    if (ready != Interest::kNone) {
      out.push_back({fds_[i].fd, ready});
      ++appended;
    }
  }
  return expected<size_t, ErrorCode>::success(appended);
}

}  // namespace evmux
