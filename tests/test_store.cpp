#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <atomic>
#include <chrono>
#include <cmath>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include <f1live/race_store.hpp>

using Catch::Approx;
using json = nlohmann::json;
using namespace f1live;

namespace {

json car_json(const std::string& name, int pos, double x = 0.0, double y = 0.0) {
  return json{{"name", name}, {"position", pos}, {"laps", 0}, {"x", x}, {"y", y},
              {"color", "#ffffff"}, {"tyre", "medium"}};
}

std::string state_text(double time, json cars, json extra = json::object()) {
  json j = extra;
  j["time"] = time;
  j["cars"] = std::move(cars);
  return j.dump();
}

std::string track_text() {
  json pts = json::array();
  for (int i = 0; i < 24; ++i) {
    const double a = kTAU * i / 24.0;
    pts.push_back({100.0 * std::cos(a), 100.0 * std::sin(a)});
  }
  return json{{"type", "track"}, {"data", {{"points", pts}, {"total_length", 628.3}}}}.dump();
}

TrackPayload square_payload() {
  TrackPayload t;
  t.points = {{0.0, 0.0}, {100.0, 0.0}, {100.0, 100.0}, {0.0, 100.0}};
  return t;
}

// Polls the store until the background fetch settles.
void drive(RaceStore& store, TrackFetcher* f) {
  for (int i = 0; i < 500; ++i) {
    store.poll();
    if (f->state() == TrackFetcher::State::Done || f->state() == TrackFetcher::State::Failed) return;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
}

} // namespace

TEST_CASE("Store starts with an empty, never-null snapshot") {
  RaceStore store;
  const auto s = store.current_snapshot();
  REQUIRE(s != nullptr);
  REQUIRE(s->cars.empty());
  REQUIRE(s->sim_time == 0.0);
  REQUIRE_FALSE(s->race_started);
  REQUIRE(store.track() == nullptr);
}

TEST_CASE("Store replaces the snapshot wholesale and keeps held copies intact") {
  RaceStore store;
  REQUIRE(store.ingest(state_text(1.0, json::array({car_json("A", 1), car_json("B", 2)}))));
  const auto held = store.current_snapshot();

  REQUIRE(store.ingest(state_text(2.0, json::array({car_json("A", 1)}))));
  const auto now = store.current_snapshot();
  REQUIRE(now->sim_time == Approx(2.0));
  REQUIRE(now->cars.size() == 1);

  REQUIRE(held->sim_time == Approx(1.0));
  REQUIRE(held->cars.size() == 2);
  REQUIRE(store.snapshots_received() == 2);
}

TEST_CASE("Store drops malformed messages and keeps the current snapshot") {
  RaceStore store;
  REQUIRE(store.ingest(state_text(5.0, json::array({car_json("A", 1)}))));
  const auto before = store.current_snapshot();

  REQUIRE_FALSE(store.ingest("{{{"));
  REQUIRE_FALSE(store.ingest(R"({"hello": "world"})"));
  REQUIRE(store.messages_dropped() == 2);
  REQUIRE(store.current_snapshot() == before);
}

TEST_CASE("Store accepts snapshots whose positions are not a permutation") {
  RaceStore store;
  REQUIRE(store.ingest(state_text(1.0, json::array({car_json("A", 1), car_json("B", 1)}))));
  REQUIRE(store.current_snapshot()->cars.size() == 2);
}

TEST_CASE("Reset publishes a local override and is idempotent") {
  int sent = 0;
  std::string last;
  RaceStore store([&](std::string_view m) { ++sent; last = std::string(m); return true; });
  REQUIRE(store.ingest(state_text(10.0, json::array({car_json("A", 1)}), {{"race_started", true}})));
  REQUIRE(store.current_snapshot()->race_started);

  store.request_reset();
  REQUIRE(sent == 1);
  REQUIRE(last == R"({"type":"reset"})");
  REQUIRE(store.reset_pending());
  const auto first = store.current_snapshot();
  REQUIRE_FALSE(first->race_started);
  REQUIRE_FALSE(first->race_finished);
  REQUIRE(first->sim_time == 0.0);
  REQUIRE(first->cars.size() == 1);
  REQUIRE(store.epoch() == 0);

  store.request_reset();
  REQUIRE(sent == 1);
  const auto second = store.current_snapshot();
  REQUIRE(second->race_started == first->race_started);
  REQUIRE(second->sim_time == first->sim_time);

  // the next authoritative snapshot supersedes the override
  REQUIRE(store.ingest(state_text(0.5, json::array({car_json("A", 1)}), {{"race_started", true}})));
  REQUIRE_FALSE(store.reset_pending());
  REQUIRE(store.current_snapshot()->race_started);
  REQUIRE(store.current_snapshot()->sim_time == Approx(0.5));
  REQUIRE(store.epoch() == 1);
}

TEST_CASE("Reset still applies locally when the request cannot be sent") {
  RaceStore store([](std::string_view) { return false; });
  REQUIRE(store.ingest(state_text(3.0, json::array({car_json("A", 1)}), {{"race_finished", true}})));
  store.request_reset();
  REQUIRE(store.reset_pending());
  REQUIRE_FALSE(store.current_snapshot()->race_finished);

  RaceStore unsent;
  unsent.request_reset();
  REQUIRE(unsent.reset_pending());
}

TEST_CASE("A large drop in sim time starts a new epoch and clears derived state") {
  RaceStore store;
  store.ingest(state_text(10.0, json::array({car_json("A", 2), car_json("B", 1)})));
  store.ingest(state_text(11.0, json::array({car_json("A", 1), car_json("B", 2)})));
  REQUIRE_FALSE(store.race_log().empty());
  REQUIRE(store.epoch() == 0);

  store.ingest(state_text(11.0, json::array({car_json("A", 1), car_json("B", 2)})));
  REQUIRE(store.epoch() == 0);

  store.ingest(state_text(2.0, json::array({car_json("A", 2), car_json("B", 1)})));
  REQUIRE(store.epoch() == 1);
  REQUIRE(store.race_log().empty());
  REQUIRE(store.position_changes().empty());
}

TEST_CASE("A late tick is dropped without touching derived state") {
  RaceStore store;
  store.ingest(state_text(40.0, json::array({car_json("A", 2, 80.0), car_json("B", 1, 90.0)})));
  store.ingest(state_text(41.0, json::array({car_json("A", 1, 99.0), car_json("B", 2, 95.0)})));
  REQUIRE(store.race_log().size() == 1);
  const auto before = store.current_snapshot();

  REQUIRE(store.ingest(state_text(40.95, json::array({car_json("A", 2, 98.0), car_json("B", 1, 96.0)}))));
  REQUIRE(store.epoch() == 0);
  REQUIRE(store.messages_dropped() == 1);
  REQUIRE(store.race_log().size() == 1);
  REQUIRE(store.position_changes().at("A") == 1);
  REQUIRE(store.current_snapshot() == before);
  REQUIRE(store.current_snapshot()->sim_time == Approx(41.0));
  REQUIRE(find_car(*store.current_snapshot(), "A")->position.x == Approx(99.0));

  // newer ticks keep flowing
  store.ingest(state_text(41.1, json::array({car_json("A", 1, 100.0), car_json("B", 2, 96.0)})));
  REQUIRE(store.current_snapshot()->sim_time == Approx(41.1));
  REQUIRE(store.epoch() == 0);
}

TEST_CASE("Time going back to the start or past the threshold is a restart") {
  SECTION("back near zero") {
    RaceStore store;
    store.ingest(state_text(3.0, json::array({car_json("A", 1)})));
    store.ingest(state_text(0.2, json::array({car_json("A", 1)})));
    REQUIRE(store.epoch() == 1);
    REQUIRE(store.messages_dropped() == 0);
  }
  SECTION("configured threshold") {
    RaceStore store;
    store.set_restart_threshold(0.5);
    store.ingest(state_text(30.0, json::array({car_json("A", 1)})));
    store.ingest(state_text(29.8, json::array({car_json("A", 1)})));
    REQUIRE(store.epoch() == 0);
    store.ingest(state_text(29.0, json::array({car_json("A", 1)})));
    REQUIRE(store.epoch() == 1);
  }
}

TEST_CASE("Race log records overtakes, DRS and pit stops") {
  RaceStore store;
  json a = car_json("A", 2);
  json b = car_json("B", 1);
  store.ingest(state_text(1.0, json::array({a, b})));

  a["position"] = 1;
  b["position"] = 2;
  a["drs_active"] = true;
  b["on_pit"] = true;
  b["laps"] = 2;
  b["tyre"] = "soft";
  store.ingest(state_text(2.0, json::array({a, b})));

  REQUIRE(store.position_changes().at("A") == 1);
  REQUIRE(store.position_changes().at("B") == -1);

  const auto& log = store.race_log();
  REQUIRE(log.size() == 3);
  REQUIRE(log[0].kind == LogKind::Overtake);
  REQUIRE(log[0].message == "A overtook P2 -> P1");
  REQUIRE(log[0].time == Approx(2.0));
  REQUIRE(log[1].kind == LogKind::Drs);
  REQUIRE(log[1].message == "A activated DRS");
  REQUIRE(log[2].kind == LogKind::PitEntry);
  REQUIRE(log[2].driver == "B");
  REQUIRE(log[2].details == "Lap 3, Tyre: soft");

  b["on_pit"] = false;
  b["pitstop_count"] = 1;
  b["tyre"] = "hard";
  store.ingest(state_text(3.0, json::array({a, b})));
  REQUIRE(store.race_log().size() == 4);
  REQUIRE(store.race_log().back().kind == LogKind::PitExit);
  REQUIRE(store.race_log().back().details == "New tyres: hard");
}

TEST_CASE("Server race events are appended incrementally") {
  RaceStore store;
  json ev1 = {{"time", 4.0}, {"driver", "A"}, {"message", "A ran wide"}, {"error_type", "off_track"},
              {"time_loss", 1.5}, {"lap", 4}};
  json ev2 = {{"time", 6.0}, {"driver", "B"}, {"message", "B spun"}, {"error_type", "spin"},
              {"time_loss", 3.0}, {"lap", 5}};

  store.ingest(state_text(5.0, json::array({car_json("A", 1)}), {{"race_events", json::array({ev1})}}));
  REQUIRE(store.race_log().size() == 1);
  REQUIRE(store.race_log()[0].kind == LogKind::Incident);
  REQUIRE(store.race_log()[0].details == "Lap 4, -1.50s");
  REQUIRE(store.race_log()[0].time_loss == Approx(1.5));

  store.ingest(state_text(6.0, json::array({car_json("A", 1)}), {{"race_events", json::array({ev1})}}));
  REQUIRE(store.race_log().size() == 1);

  store.ingest(state_text(7.0, json::array({car_json("A", 1)}), {{"race_events", json::array({ev1, ev2})}}));
  REQUIRE(store.race_log().size() == 2);
  REQUIRE(store.race_log()[1].message == "B spun");
}

TEST_CASE("Race log keeps the most recent entries only") {
  RaceStore store;
  json events = json::array();
  for (int i = 0; i < 70; ++i) {
    events.push_back({{"time", double(i)}, {"driver", "A"}, {"message", "event " + std::to_string(i)},
                      {"time_loss", 0.1}, {"lap", 1}});
  }
  store.ingest(state_text(80.0, json::array({car_json("A", 1)}), {{"race_events", events}}));
  REQUIRE(store.race_log().size() == RaceStore::kMaxLogEntries);
  REQUIRE(store.race_log().front().message == "event 20");
  REQUIRE(store.race_log().back().message == "event 69");
}

TEST_CASE("Leader lap changes are counted") {
  RaceStore store;
  json a = car_json("A", 1);
  store.ingest(state_text(1.0, json::array({a})));
  REQUIRE(store.lap_changes() == 0);

  a["laps"] = 1;
  store.ingest(state_text(2.0, json::array({a})));
  store.ingest(state_text(3.0, json::array({a})));
  REQUIRE(store.leader_lap() == 1);
  REQUIRE(store.lap_changes() == 1);
}

TEST_CASE("Track arrives on the stream") {
  RaceStore store;
  REQUIRE(store.ingest(track_text()));
  REQUIRE(store.has_track_payload());
  REQUIRE(store.track() != nullptr);
  REQUIRE(store.track_version() == 1);
  REQUIRE(store.track()->centerline().size() == 24);
}

TEST_CASE("Unusable track is kept as payload but renders without a surface") {
  RaceStore store;
  REQUIRE(store.ingest(R"({"type":"track","data":{"points":[[0,0],[1,1]],"total_length":2}})"));
  REQUIRE(store.has_track_payload());
  REQUIRE(store.track() == nullptr);
  // state keeps flowing
  REQUIRE(store.ingest(state_text(1.0, json::array({car_json("A", 1)}))));
}

TEST_CASE("Fallback fetch supplies the track when the stream has none") {
  RaceStore store;
  std::atomic<int> calls{0};
  auto fetcher = std::make_unique<TrackFetcher>([&]() -> std::optional<TrackPayload> {
    ++calls;
    return square_payload();
  });
  TrackFetcher* f = fetcher.get();
  store.set_track_fetcher(std::move(fetcher));

  drive(store, f);
  store.poll();
  REQUIRE(f->state() == TrackFetcher::State::Done);
  REQUIRE(store.has_track_payload());
  REQUIRE(store.track() != nullptr);
  REQUIRE(store.track()->centerline().size() == 4);

  for (int i = 0; i < 5; ++i) store.poll();
  REQUIRE(calls.load() == 1);
}

TEST_CASE("Fallback fetch is not used once the stream delivered a track") {
  RaceStore store;
  std::atomic<int> calls{0};
  store.set_track_fetcher(std::make_unique<TrackFetcher>([&]() -> std::optional<TrackPayload> {
    ++calls;
    return square_payload();
  }));
  store.ingest(track_text());
  for (int i = 0; i < 5; ++i) store.poll();
  REQUIRE(calls.load() == 0);
  REQUIRE(store.track()->centerline().size() == 24);
}

TEST_CASE("A failed fallback fetch leaves the store without a track") {
  RaceStore store;
  auto fetcher = std::make_unique<TrackFetcher>([]() -> std::optional<TrackPayload> { return std::nullopt; });
  TrackFetcher* f = fetcher.get();
  store.set_track_fetcher(std::move(fetcher));

  drive(store, f);
  REQUIRE(f->state() == TrackFetcher::State::Failed);
  REQUIRE_FALSE(store.has_track_payload());
  REQUIRE(store.ingest(state_text(1.0, json::array({car_json("A", 1)}))));
}
