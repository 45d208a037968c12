#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include <f1live/control_client.hpp>

using Catch::Approx;
using namespace f1live;

namespace {

struct Call {
  ControlClient::Method method;
  std::string url;
  std::string body;
};

// Records every request; answers with a fixed response.
struct FakeServer {
  std::mutex mu;
  std::vector<Call> calls;
  HttpResponse reply{true, 200, "{}", {}};

  ControlClient::Requester requester() {
    return [this](ControlClient::Method m, const std::string& url, const std::string& body) {
      std::lock_guard<std::mutex> lock(mu);
      calls.push_back({m, url, body});
      return reply;
    };
  }
};

std::vector<ControlResult> drain(ControlClient& c) {
  std::vector<ControlResult> all;
  for (int i = 0; i < 500 && (c.in_flight() > 0 || all.empty()); ++i) {
    auto r = c.poll();
    all.insert(all.end(), r.begin(), r.end());
    if (c.in_flight() == 0) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return all;
}

} // namespace

TEST_CASE("Control requests hit the expected endpoints") {
  FakeServer server;
  ControlClient c("http://race:8000", server.requester());

  c.pause();
  drain(c);
  c.resume();
  drain(c);
  c.set_speed(2.0);
  drain(c);
  c.request_status();
  drain(c);
  c.start_race(Weather{0.5, 30.0, 4.0});
  drain(c);

  std::lock_guard<std::mutex> lock(server.mu);
  REQUIRE(server.calls.size() == 5);
  REQUIRE(server.calls[0].url == "http://race:8000/api/simulation/pause");
  REQUIRE(server.calls[0].method == ControlClient::Method::Post);
  REQUIRE(server.calls[0].body == "{}");
  REQUIRE(server.calls[1].url == "http://race:8000/api/simulation/resume");
  REQUIRE(server.calls[2].url == "http://race:8000/api/simulation/speed");
  REQUIRE(server.calls[2].body == encode_speed_request(2.0));
  REQUIRE(server.calls[3].url == "http://race:8000/api/race-status");
  REQUIRE(server.calls[3].method == ControlClient::Method::Get);
  REQUIRE(server.calls[4].url == "http://race:8000/api/start");
  REQUIRE(server.calls[4].body == encode_start_request(Weather{0.5, 30.0, 4.0}));
}

TEST_CASE("Successful acknowledgements update paused and speed") {
  FakeServer server;
  ControlClient c("http://h", server.requester());
  REQUIRE_FALSE(c.paused());
  REQUIRE(c.speed() == Approx(1.0));

  c.pause();
  auto r = drain(c);
  REQUIRE(r.size() == 1);
  REQUIRE(r[0].kind == ControlKind::Pause);
  REQUIRE(r[0].ok);
  REQUIRE(c.paused());

  c.set_speed(5.0);
  drain(c);
  REQUIRE(c.speed() == Approx(5.0));

  // server-reported state wins over the request
  server.reply.body = R"({"paused": false, "speed_multiplier": 2.0})";
  c.request_status();
  drain(c);
  REQUIRE_FALSE(c.paused());
  REQUIRE(c.speed() == Approx(2.0));
}

TEST_CASE("Failed requests leave the state unchanged") {
  FakeServer server;
  server.reply = HttpResponse{false, 503, "", "HTTP 503"};
  ControlClient c("http://h", server.requester());

  c.pause();
  c.set_speed(0.5);
  const auto r = drain(c);
  REQUIRE(r.size() == 2);
  for (const auto& res : r) {
    REQUIRE_FALSE(res.ok);
    REQUIRE(res.error == "HTTP 503");
  }
  REQUIRE_FALSE(c.paused());
  REQUIRE(c.speed() == Approx(1.0));
  REQUIRE(c.in_flight() == 0);
}

TEST_CASE("Speed steps walk the preset list") {
  FakeServer server;
  ControlClient c("http://h", server.requester());
  REQUIRE(c.faster_step() == Approx(2.0));
  REQUIRE(c.slower_step() == Approx(0.5));

  c.set_speed(5.0);
  drain(c);
  REQUIRE(c.faster_step() == Approx(5.0));
  REQUIRE(c.slower_step() == Approx(2.0));

  c.set_speed(0.5);
  drain(c);
  REQUIRE(c.slower_step() == Approx(0.5));
}
