#ifndef EVMUX_TESTS_TEST_SUPPORT_HPP_
#define EVMUX_TESTS_TEST_SUPPORT_HPP_

#include <cerrno>
#include <cstdint>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <signal.h>
#include <string>
#include <string_view>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <vector>

// ============================================================================
// Minimal blocking TCP test client (raw POSIX socket)
// ============================================================================

class TestClient {
 public:
  TestClient() = default;
  ~TestClient() { disconnect(); }

  TestClient(const TestClient&) = delete;
  TestClient& operator=(const TestClient&) = delete;

  TestClient(TestClient&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

  bool connect(uint16_t port) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0)
      return false;

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = inet_addr("127.0.0.1");

    if (::connect(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
      ::close(fd_);
      fd_ = -1;
      return false;
    }
    set_timeout(2000);
    return true;
  }

  bool send(std::string_view data) {
    size_t sent = 0;
    while (sent < data.size()) {
      ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
      if (n <= 0)
        return false;
      sent += static_cast<size_t>(n);
    }
    return true;
  }

  // Reads exactly len bytes; returns what arrived before EOF or timeout.
  std::string recv_exact(size_t len) {
    std::string out(len, '\0');
    size_t got = 0;
    while (got < len) {
      ssize_t n = ::recv(fd_, &out[got], len - got, 0);
      if (n <= 0)
        break;
      got += static_cast<size_t>(n);
    }
    out.resize(got);
    return out;
  }

  // True once the server has closed its end (recv returns 0).
  bool wait_for_eof() {
    char buf[64];
    for (;;) {
      ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
      if (n == 0)
        return true;
      if (n < 0)
        return false;
    }
  }

  // Aborts the connection with RST instead of FIN.
  void reset() {
    struct linger lg{};
    lg.l_onoff = 1;
    lg.l_linger = 0;
    setsockopt(fd_, SOL_SOCKET, SO_LINGER, &lg, sizeof(lg));
    disconnect();
  }

  void disconnect() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  uint16_t local_port() const {
    struct sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0)
      return 0;
    return ntohs(addr.sin_port);
  }

  int fd() const { return fd_; }

 private:
  void set_timeout(int timeout_ms) {
    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  }

  int fd_ = -1;
};

// ============================================================================
// Resource and signal helpers
// ============================================================================

// Lowers the soft RLIMIT_NOFILE for the current scope
class ScopedFdLimit {
 public:
  explicit ScopedFdLimit(rlim_t soft) {
    if (getrlimit(RLIMIT_NOFILE, &saved_) != 0)
      return;
    struct rlimit lowered = saved_;
    lowered.rlim_cur = soft;
    ok_ = setrlimit(RLIMIT_NOFILE, &lowered) == 0;
  }
  ~ScopedFdLimit() {
    if (ok_)
      setrlimit(RLIMIT_NOFILE, &saved_);
  }

  ScopedFdLimit(const ScopedFdLimit&) = delete;
  ScopedFdLimit& operator=(const ScopedFdLimit&) = delete;

  bool ok() const { return ok_; }

 private:
  struct rlimit saved_ {};
  bool ok_ = false;
};

// Lowest descriptor number open() would hand out next
inline int lowest_free_fd() {
  int fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (fd >= 0)
    ::close(fd);
  return fd;
}

// Opens /dev/null until the process limit is hit; closes everything on exit
class FdExhauster {
 public:
  FdExhauster() {
    for (;;) {
      int fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
      if (fd < 0) {
        exhausted_ = (errno == EMFILE);
        break;
      }
      fds_.push_back(fd);
    }
  }
  ~FdExhauster() {
    for (int fd : fds_)
      ::close(fd);
  }

  FdExhauster(const FdExhauster&) = delete;
  FdExhauster& operator=(const FdExhauster&) = delete;

  bool exhausted() const { return exhausted_; }

 private:
  std::vector<int> fds_;
  bool exhausted_ = false;
};

// Installs a no-op handler without SA_RESTART so a blocked poll() sees EINTR
class ScopedInterruptSignal {
 public:
  static constexpr int kSignal = SIGUSR1;

  ScopedInterruptSignal() {
    struct sigaction sa {};
    sa.sa_handler = &ScopedInterruptSignal::on_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    ok_ = sigaction(kSignal, &sa, &old_) == 0;
  }
  ~ScopedInterruptSignal() {
    if (ok_)
      sigaction(kSignal, &old_, nullptr);
  }

  ScopedInterruptSignal(const ScopedInterruptSignal&) = delete;
  ScopedInterruptSignal& operator=(const ScopedInterruptSignal&) = delete;

  bool ok() const { return ok_; }

 private:
  static void on_signal(int) {}

  struct sigaction old_ {};
  bool ok_ = false;
};

#endif  // EVMUX_TESTS_TEST_SUPPORT_HPP_
