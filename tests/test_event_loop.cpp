#include "evmux/connection.hpp"
#include "evmux/event_loop.hpp"
#include "evmux/upper_echo.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <pthread.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace evmux;

// ============================================================================
// Test helper: loop on an ephemeral loopback port, driven with run_once()
// ============================================================================

namespace {

struct Recorder {
  std::vector<PeerAddress> connects;
  std::vector<std::string> reads;
  std::vector<PeerAddress> disconnects;
  std::vector<int> fds;

  Callbacks callbacks() {
    Callbacks cb;
    cb.on_connect = [this](const ConnPtr& conn, const PeerAddress& peer) {
      connects.push_back(peer);
      fds.push_back(conn->get_fd());
    };
    cb.on_read = [this](const ConnPtr& conn, const PeerAddress& peer, std::string_view data) {
      reads.emplace_back(data);
      return upper_echo(conn, peer, data);
    };
    cb.on_disconnect = [this](const ConnPtr&, const PeerAddress& peer) { disconnects.push_back(peer); };
    return cb;
  }
};

LoopConfig loopback_config() { return LoopConfig().set_bind_addr("127.0.0.1"); }

}  // namespace

TEST_CASE("EventLoop - construction binds and registers the listener", "[event_loop]") {
  EventLoop loop(loopback_config());
  REQUIRE(loop.get_state() == LoopState::kRunning);
  REQUIRE(loop.get_listen_port() != 0);
  REQUIRE(loop.selector().is_registered(loop.get_listen_fd()));
  REQUIRE(loop.selector().find(loop.get_listen_fd())->handler->kind() == HandlerKind::kAcceptor);
  // Listener plus the internal wakeup descriptor
  REQUIRE(loop.selector().size() == 2);
  REQUIRE(loop.get_connection_count() == 0);
}

TEST_CASE("EventLoop - bind failure throws", "[event_loop]") {
  EventLoop first(loopback_config());
  REQUIRE_THROWS_AS(EventLoop(loopback_config().set_port(first.get_listen_port())), std::runtime_error);
}

TEST_CASE("EventLoop - hello, HELLO, close", "[event_loop]") {
  Recorder rec;
  EventLoop loop(loopback_config(), rec.callbacks());

  TestClient client;
  REQUIRE(client.connect(loop.get_listen_port()));
  auto accepted = loop.run_once();
  REQUIRE(accepted);
  REQUIRE(accepted.value() == 1);

  REQUIRE(rec.connects.size() == 1);
  REQUIRE(rec.connects[0].port == client.local_port());
  REQUIRE(loop.get_connection_count() == 1);
  const int fd = rec.fds[0];
  REQUIRE(loop.selector().is_registered(fd));

  REQUIRE(client.send("hello"));
  REQUIRE(loop.run_once());
  REQUIRE(rec.reads.size() == 1);
  REQUIRE(rec.reads[0] == "hello");
  REQUIRE(client.recv_exact(5) == "HELLO");

  REQUIRE(client.send("close"));
  REQUIRE(loop.run_once());
  REQUIRE(rec.reads.size() == 2);
  REQUIRE(rec.disconnects.size() == 1);
  REQUIRE(rec.disconnects[0].port == client.local_port());
  REQUIRE(!loop.selector().is_registered(fd));
  REQUIRE(loop.selector().size() == 2);
  REQUIRE(client.wait_for_eof());
  REQUIRE(loop.get_connection_count() == 0);
  REQUIRE(loop.stats().late_dispatches.load() == 0);
}

TEST_CASE("EventLoop - orderly client shutdown disconnects once", "[event_loop]") {
  Recorder rec;
  EventLoop loop(loopback_config(), rec.callbacks());

  TestClient client;
  REQUIRE(client.connect(loop.get_listen_port()));
  REQUIRE(loop.run_once());
  const int fd = rec.fds[0];

  client.disconnect();
  REQUIRE(loop.run_once());
  REQUIRE(rec.disconnects.size() == 1);
  REQUIRE(rec.reads.empty());
  REQUIRE(!loop.selector().is_registered(fd));
  REQUIRE(loop.stats().disconnects.load() == 1);
  REQUIRE(loop.stats().late_dispatches.load() == 0);
}

TEST_CASE("EventLoop - client reset disconnects once", "[event_loop]") {
  Recorder rec;
  EventLoop loop(loopback_config(), rec.callbacks());

  TestClient client;
  REQUIRE(client.connect(loop.get_listen_port()));
  REQUIRE(loop.run_once());
  const int fd = rec.fds[0];

  client.reset();
  REQUIRE(loop.run_once());
  REQUIRE(rec.disconnects.size() == 1);
  REQUIRE(!loop.selector().is_registered(fd));
  REQUIRE(loop.get_state() == LoopState::kRunning);
  REQUIRE(loop.stats().late_dispatches.load() == 0);
}

TEST_CASE("EventLoop - clients are served independently", "[event_loop]") {
  Recorder rec;
  EventLoop loop(loopback_config(), rec.callbacks());

  TestClient a;
  TestClient b;
  REQUIRE(a.connect(loop.get_listen_port()));
  REQUIRE(loop.run_once());
  REQUIRE(b.connect(loop.get_listen_port()));
  REQUIRE(loop.run_once());
  REQUIRE(loop.get_connection_count() == 2);

  REQUIRE(b.send("from b"));
  REQUIRE(loop.run_once());
  REQUIRE(b.recv_exact(6) == "FROM B");

  REQUIRE(a.send("from a"));
  REQUIRE(loop.run_once());
  REQUIRE(a.recv_exact(6) == "FROM A");

  // Closing one leaves the other registered
  a.disconnect();
  REQUIRE(loop.run_once());
  REQUIRE(loop.get_connection_count() == 1);
  REQUIRE(loop.selector().is_registered(rec.fds[1]));
}

TEST_CASE("EventLoop - stop wakes a pending wait without dispatching", "[event_loop]") {
  EventLoop loop(loopback_config());
  loop.stop();
  REQUIRE(loop.stop_requested());

  auto n = loop.run_once();
  REQUIRE(n);
  REQUIRE(n.value() == 0);
}

TEST_CASE("EventLoop - run after stop tears everything down", "[event_loop]") {
  Recorder rec;
  EventLoop loop(loopback_config(), rec.callbacks());

  TestClient client;
  REQUIRE(client.connect(loop.get_listen_port()));
  REQUIRE(loop.run_once());

  loop.stop();
  auto result = loop.run();
  REQUIRE(result);
  REQUIRE(loop.get_state() == LoopState::kStopped);

  // Remaining clients go through the disconnect path, then the listener closes
  REQUIRE(rec.disconnects.size() == 1);
  REQUIRE(loop.selector().size() == 0);
  REQUIRE(loop.stats().late_dispatches.load() == 0);
  REQUIRE(client.wait_for_eof());

  TestClient late;
  REQUIRE(!late.connect(loop.get_listen_port()));

  auto again = loop.run();
  REQUIRE(!again);
  REQUIRE(again.get_error() == ErrorCode::kInvalidState);
  auto once = loop.run_once();
  REQUIRE(!once);
  REQUIRE(once.get_error() == ErrorCode::kInvalidState);
}

TEST_CASE("EventLoop - destruction without run closes clients", "[event_loop]") {
  Recorder rec;
  TestClient client;
  {
    EventLoop loop(loopback_config(), rec.callbacks());
    REQUIRE(client.connect(loop.get_listen_port()));
    REQUIRE(loop.run_once());
  }
  REQUIRE(rec.disconnects.size() == 1);
  REQUIRE(client.wait_for_eof());
}

TEST_CASE("EventLoop - max_connections turns extra clients away", "[event_loop]") {
  Recorder rec;
  EventLoop loop(loopback_config().set_max_connections(1), rec.callbacks());

  TestClient first;
  TestClient second;
  REQUIRE(first.connect(loop.get_listen_port()));
  REQUIRE(loop.run_once());
  REQUIRE(second.connect(loop.get_listen_port()));
  REQUIRE(loop.run_once());

  REQUIRE(rec.connects.size() == 1);
  REQUIRE(loop.stats().rejected_connections.load() == 1);
  REQUIRE(second.wait_for_eof());

  REQUIRE(first.send("still here"));
  REQUIRE(loop.run_once());
  REQUIRE(first.recv_exact(10) == "STILL HERE");
}

TEST_CASE("EventLoop - interrupted wait keeps the loop running", "[event_loop]") {
  ScopedInterruptSignal interrupt;
  REQUIRE(interrupt.ok());

  EventLoop loop(loopback_config(), make_upper_echo_callbacks());
  bool run_ok = false;
  std::thread runner([&]() { run_ok = static_cast<bool>(loop.run()); });

  for (int i = 0; i < 5; ++i) {
    pthread_kill(runner.native_handle(), ScopedInterruptSignal::kSignal);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }

  TestClient client;
  REQUIRE(client.connect(loop.get_listen_port()));
  REQUIRE(client.send("after signal"));
  REQUIRE(client.recv_exact(12) == "AFTER SIGNAL");
  REQUIRE(loop.get_state() == LoopState::kRunning);

  loop.stop();
  runner.join();
  REQUIRE(run_ok);
  REQUIRE(loop.get_state() == LoopState::kStopped);
}

TEST_CASE("EventLoop - poll failure stops the loop with kPollError", "[event_loop]") {
  Recorder rec;
  EventLoop loop(loopback_config(), rec.callbacks());

  std::vector<TestClient> clients(3);
  for (auto& client : clients) {
    REQUIRE(client.connect(loop.get_listen_port()));
    REQUIRE(loop.run_once());
  }
  REQUIRE(loop.get_connection_count() == 3);

  // Five watched descriptors against a limit of two: poll() fails with EINVAL
  auto result = [&]() {
    ScopedFdLimit limit(2);
    REQUIRE(limit.ok());
    return loop.run();
  }();

  REQUIRE(!result);
  REQUIRE(result.get_error() == ErrorCode::kPollError);
  REQUIRE(loop.get_state() == LoopState::kStopped);
  REQUIRE(loop.selector().size() == 0);
  REQUIRE(rec.disconnects.size() == 3);
  REQUIRE(loop.stats().late_dispatches.load() == 0);
  for (auto& client : clients) {
    REQUIRE(client.wait_for_eof());
  }

  TestClient late;
  REQUIRE(!late.connect(loop.get_listen_port()));
}
