#ifndef EVMUX_REGISTRATION_TABLE_HPP_
#define EVMUX_REGISTRATION_TABLE_HPP_

#include "handler.hpp"
#include "poller.hpp"

#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

namespace evmux {

struct Registration {
  int fd;
  Interest interest;
  std::shared_ptr<Handler> handler;
};

// ============================================================================
// RegistrationTable (fd -> interest + handler)
// ============================================================================

class RegistrationTable {
 public:
  // Returns false if reg.fd is already present; the table is left unchanged.
  bool insert(Registration reg) {
    const int fd = reg.fd;
    return entries_.emplace(fd, std::move(reg)).second;
  }

  // Removes fd and hands back its handler, or nullptr if fd was absent.
  std::shared_ptr<Handler> erase(int fd) {
    auto it = entries_.find(fd);
    if (it == entries_.end()) {
      return nullptr;
    }
    std::shared_ptr<Handler> handler = std::move(it->second.handler);
    entries_.erase(it);
    return handler;
  }

  const Registration* find(int fd) const {
    auto it = entries_.find(fd);
    return it == entries_.end() ? nullptr : &it->second;
  }

  bool contains(int fd) const { return entries_.find(fd) != entries_.end(); }
  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  std::vector<Registration> snapshot() const {
    std::vector<Registration> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
      out.push_back(entry.second);
    }
    return out;
  }

 private:
  std::unordered_map<int, Registration> entries_;
};

}  // namespace evmux

#endif  // EVMUX_REGISTRATION_TABLE_HPP_
