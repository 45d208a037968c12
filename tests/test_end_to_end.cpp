#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <f1live/interp.hpp>
#include <f1live/race_store.hpp>
#include <f1live/transport.hpp>

using Catch::Approx;
using json = nlohmann::json;
using namespace f1live;
using ms = std::chrono::milliseconds;

namespace {

struct Wire {
  std::vector<std::string> inbound;
  std::vector<std::string> sent;
};

class LoopbackConnection final : public Connection {
public:
  explicit LoopbackConnection(Wire& w) : w_(w) {}
  ConnectStatus poll_connect() override { return ConnectStatus::Open; }
  bool send_text(std::string_view text) override { w_.sent.emplace_back(text); return true; }
  bool read_messages(std::vector<std::string>& out) override {
    out.insert(out.end(), w_.inbound.begin(), w_.inbound.end());
    w_.inbound.clear();
    return true;
  }
  const std::string& error() const override { return error_; }

private:
  Wire& w_;
  std::string error_;
};

std::string state_at(double time, double x, double y = 0.0) {
  json car{{"name", "VER"}, {"position", 1}, {"laps", 0}, {"x", x}, {"y", y}, {"color", "#1e41ff"}};
  return json{{"time", time}, {"race_started", true}, {"cars", json::array({car})}}.dump();
}

// The pipeline the viewer runs each frame: transport -> store -> interpolator.
struct Pipeline {
  Wire wire;
  TransportChannel transport{[this]() -> std::unique_ptr<Connection> {
    return std::make_unique<LoopbackConnection>(wire);
  }};
  RaceStore store{[this](std::string_view m) { return transport.send(m); }};
  MotionInterpolator interp;
  TransportChannel::Clock::time_point now{};

  Pipeline() {
    transport.subscribe([this](std::string_view m) { store.ingest(m); });
    transport.start(now);
  }

  const RenderFrame& frame() {
    now += ms{16};
    transport.poll(now);
    store.poll();
    return interp.update(*store.current_snapshot(), store.track(), store.epoch());
  }
};

} // namespace

TEST_CASE("Cars glide between snapshots delivered over the transport") {
  Pipeline p;
  p.wire.inbound = {state_at(1.0, 0.0)};
  REQUIRE(p.frame().cars.at(0).position.x == Approx(0.0));

  p.wire.inbound = {state_at(1.5, 10.0)};
  double prev = 0.0;
  for (int i = 0; i < 120; ++i) {
    const double x = p.frame().cars.at(0).position.x;
    REQUIRE(x >= prev);
    REQUIRE(x <= 10.0);
    prev = x;
  }
  REQUIRE(prev == Approx(10.0).margin(1e-2));
  REQUIRE(p.frame().sim_time == Approx(1.5));
}

TEST_CASE("Reset goes out on the wire and a restarted race snaps cars") {
  Pipeline p;
  p.wire.inbound = {state_at(40.0, 0.0)};
  p.frame();
  p.wire.inbound = {state_at(41.0, 50.0)};
  p.frame();
  REQUIRE(p.interp.find("VER")->phase == MotionPhase::Tracking);

  p.store.request_reset();
  REQUIRE(p.wire.sent.size() == 1);
  REQUIRE(json::parse(p.wire.sent[0])["type"] == "reset");
  REQUIRE_FALSE(p.store.current_snapshot()->race_started);

  const std::uint64_t before = p.store.epoch();
  p.wire.inbound = {state_at(0.5, 200.0)};
  const RenderFrame& f = p.frame();
  REQUIRE(p.store.epoch() == before + 1);
  REQUIRE_FALSE(p.store.reset_pending());
  REQUIRE(f.cars.at(0).position.x == Approx(200.0));
}

TEST_CASE("A streamed track keeps cars on the surface") {
  Pipeline p;
  json pts = json::array();
  for (int i = 0; i < 36; ++i) {
    const double a = kTAU * i / 36.0;
    pts.push_back({100.0 * std::cos(a), 100.0 * std::sin(a)});
  }
  p.wire.inbound = {json{{"type", "track"}, {"data", {{"points", pts}}}}.dump(), state_at(1.0, 150.0)};
  const RenderFrame& f = p.frame();
  REQUIRE(p.store.track() != nullptr);
  REQUIRE(f.track == p.store.track());
  REQUIRE(f.cars.at(0).position.x == Approx(110.0));
}
