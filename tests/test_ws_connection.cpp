#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <f1live/connection.hpp>
#include <f1live/http_client.hpp>

using namespace f1live;
using Clock = std::chrono::steady_clock;

namespace {

// Polls until the connection settles or the deadline passes.
ConnectStatus settle(Connection& c, std::chrono::seconds limit) {
  const auto deadline = Clock::now() + limit;
  ConnectStatus s = c.poll_connect();
  while (s == ConnectStatus::Pending && Clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    s = c.poll_connect();
  }
  return s;
}

} // namespace

TEST_CASE("WebSocket connect failures are reported through poll_connect") {
  CurlGlobal curl;

  SECTION("plain ws") {
    auto c = Connection::create_websocket("ws://127.0.0.1:1/ws", 2);
    REQUIRE(c != nullptr);
    REQUIRE(settle(*c, std::chrono::seconds(10)) == ConnectStatus::Failed);
    REQUIRE_FALSE(c->error().empty());
    REQUIRE_FALSE(c->send_text("{}"));
    std::vector<std::string> out;
    REQUIRE_FALSE(c->read_messages(out));
  }

  SECTION("wss goes through the same path") {
    auto c = Connection::create_websocket("wss://127.0.0.1:1/ws", 2);
    REQUIRE(settle(*c, std::chrono::seconds(10)) == ConnectStatus::Failed);
    REQUIRE(c->error().find("not supported") == std::string::npos);
  }
}

TEST_CASE("WebSocket connect never blocks the caller") {
  CurlGlobal curl;

  // unroutable address: the attempt hangs until the connect timeout
  const auto t0 = Clock::now();
  auto c = Connection::create_websocket("ws://10.255.255.1:8000/ws", 5);
  const ConnectStatus first = c->poll_connect();
  REQUIRE(Clock::now() - t0 < std::chrono::seconds(1));
  REQUIRE(first != ConnectStatus::Open);

  // dropping a pending attempt cancels it
  const auto t1 = Clock::now();
  c.reset();
  REQUIRE(Clock::now() - t1 < std::chrono::seconds(4));
}
