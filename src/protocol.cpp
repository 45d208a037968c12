#include <f1live/protocol.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <nlohmann/json.hpp>

namespace f1live {

using json = nlohmann::json;

namespace {

// Type-checked field readers; a missing or mistyped field yields the default.
double num_or(const json& j, const char* key, double def) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number()) return def;
  return it->get<double>();
}

// nullopt for non-numbers and values an int cannot hold.
std::optional<int> as_int(const json& v) {
  if (!v.is_number()) return std::nullopt;
  const double d = v.get<double>();
  if (!std::isfinite(d) || d < static_cast<double>(std::numeric_limits<int>::min()) ||
      d > static_cast<double>(std::numeric_limits<int>::max())) {
    return std::nullopt;
  }
  return static_cast<int>(d);
}

int int_or(const json& j, const char* key, int def) {
  auto it = j.find(key);
  if (it == j.end()) return def;
  return as_int(*it).value_or(def);
}

bool bool_or(const json& j, const char* key, bool def) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_boolean()) return def;
  return it->get<bool>();
}

std::string str_or(const json& j, const char* key, const std::string& def = {}) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return def;
  return it->get<std::string>();
}

const json* array_at(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_array()) return nullptr;
  return &*it;
}

std::optional<TrackPayload> parse_track_object(const json& j) {
  if (!j.is_object()) return std::nullopt;
  const json* pts = array_at(j, "points");
  if (!pts) return std::nullopt;

  TrackPayload out;
  out.points.reserve(pts->size());
  for (const auto& p : *pts) {
    if (!p.is_array() || p.size() < 2 || !p[0].is_number() || !p[1].is_number()) continue;
    out.points.push_back({p[0].get<double>(), p[1].get<double>()});
  }
  out.total_length = num_or(j, "total_length", 0.0);
  return out;
}

std::optional<CarState> parse_car(const json& j) {
  if (!j.is_object()) return std::nullopt;
  CarState c;
  c.name = str_or(j, "name");
  if (c.name.empty()) return std::nullopt;

  if (auto col = parse_hex_color(str_or(j, "color"))) c.color = *col;
  c.race_position  = int_or(j, "position", 0);
  c.laps_completed = int_or(j, "laps", 0);

  auto ix = j.find("x");
  auto iy = j.find("y");
  if (ix != j.end() && iy != j.end() && ix->is_number() && iy->is_number()) {
    c.has_position = true;
    c.position = {ix->get<double>(), iy->get<double>()};
  }
  auto ia = j.find("angle");
  if (ia != j.end() && ia->is_number()) c.angle = ia->get<double>();

  c.speed_kmh     = num_or(j, "speed", 0.0);
  c.gear          = int_or(j, "gear", 0);
  c.rpm           = num_or(j, "rpm", 0.0);
  c.throttle      = std::clamp(num_or(j, "throttle", 0.0), 0.0, 1.0);
  c.brake         = std::clamp(num_or(j, "brake", 0.0), 0.0, 1.0);
  c.tyre_compound = str_or(j, "tyre");
  c.tyre_wear     = std::clamp(num_or(j, "wear", 0.0), 0.0, 1.0);
  c.tyre_temp     = num_or(j, "tire_temp", 0.0);
  c.fuel          = num_or(j, "fuel", 0.0);
  c.on_pit        = bool_or(j, "on_pit", false);
  c.pitstop_count = int_or(j, "pitstop_count", 0);
  c.drs_active    = bool_or(j, "drs_active", false);
  c.ers_energy    = num_or(j, "ers_energy", 0.0);
  c.overtaking    = bool_or(j, "overtaking", false);
  c.total_time    = num_or(j, "total_time", 0.0);
  c.time_interval = num_or(j, "time_interval", 0.0);
  c.distance_interval = num_or(j, "distance_interval", 0.0);

  if (const json* hist = array_at(j, "pitstop_history")) {
    for (const auto& h : *hist) {
      if (!h.is_object()) continue;
      c.pitstop_history.push_back({int_or(h, "lap", 0), str_or(h, "tyre")});
    }
  }
  return c;
}

ServerRaceEvent parse_server_event(const json& j) {
  ServerRaceEvent e;
  e.time       = num_or(j, "time", 0.0);
  e.driver     = str_or(j, "driver");
  e.message    = str_or(j, "message");
  e.error_type = str_or(j, "error_type");
  e.time_loss  = num_or(j, "time_loss", 0.0);
  e.lap        = int_or(j, "lap", 0);
  return e;
}

UndercutSummary parse_undercut(const json& j) {
  UndercutSummary u;
  u.car      = str_or(j, "car");
  u.lap      = int_or(j, "lap", 0);
  u.old_tyre = str_or(j, "old_tyre");
  u.new_tyre = str_or(j, "new_tyre");
  u.pit_time = num_or(j, "pit_time", 0.0);
  if (const json* list = array_at(j, "undercuts")) {
    for (const auto& r : *list) {
      if (!r.is_object()) continue;
      u.undercuts.push_back(UndercutResult{
        str_or(r, "vs"),
        num_or(r, "time_gain", 0.0),
        int_or(r, "position_before", 0),
        int_or(r, "position_after", 0),
        int_or(r, "position_change", 0),
      });
    }
  }
  return u;
}

RaceSnapshot parse_state(const json& j) {
  RaceSnapshot s;
  s.sim_time = num_or(j, "time", 0.0);

  if (const json* cars = array_at(j, "cars")) {
    s.cars.reserve(cars->size());
    for (const auto& cj : *cars) {
      auto car = parse_car(cj);
      if (!car) continue;
      // names are unique per snapshot; keep the first occurrence
      if (find_car(s, car->name)) continue;
      s.cars.push_back(std::move(*car));
    }
  }

  auto iw = j.find("weather");
  if (iw != j.end() && iw->is_object()) {
    s.weather.rain       = std::clamp(num_or(*iw, "rain", 0.0), 0.0, 1.0);
    s.weather.track_temp = num_or(*iw, "track_temp", 25.0);
    s.weather.wind       = num_or(*iw, "wind", 0.0);
  }
  s.total_laps = int_or(j, "total_laps", s.total_laps);

  auto it = j.find("tyre_distribution");
  if (it != j.end() && it->is_object()) {
    for (auto kv = it->begin(); kv != it->end(); ++kv) {
      if (auto n = as_int(kv.value())) s.tyre_distribution[kv.key()] = *n;
    }
  }

  s.race_started  = bool_or(j, "race_started", false);
  s.race_finished = bool_or(j, "race_finished", false);

  if (const json* evs = array_at(j, "race_events")) {
    for (const auto& e : *evs) if (e.is_object()) s.race_events.push_back(parse_server_event(e));
  }
  if (const json* us = array_at(j, "undercut_summary")) {
    for (const auto& u : *us) if (u.is_object()) s.undercut_summary.push_back(parse_undercut(u));
  }
  return s;
}

} // namespace

std::optional<InboundMessage> decode_message(std::string_view text) {
  const json j = json::parse(text.begin(), text.end(), nullptr, false);
  if (j.is_discarded() || !j.is_object()) return std::nullopt;

  auto type = j.find("type");
  if (type != j.end() && type->is_string() && type->get<std::string>() == "track") {
    auto data = j.find("data");
    if (data == j.end()) return std::nullopt;
    auto track = parse_track_object(*data);
    if (!track) return std::nullopt;
    return InboundMessage{TrackMessage{std::move(*track)}};
  }

  auto time = j.find("time");
  if (time == j.end() || !time->is_number()) return std::nullopt;
  return InboundMessage{StateMessage{parse_state(j)}};
}

std::optional<TrackPayload> decode_track_body(std::string_view text) {
  const json j = json::parse(text.begin(), text.end(), nullptr, false);
  if (j.is_discarded()) return std::nullopt;
  return parse_track_object(j);
}

std::optional<ControlAck> decode_control_ack(std::string_view text) {
  const json j = json::parse(text.begin(), text.end(), nullptr, false);
  if (j.is_discarded() || !j.is_object()) return std::nullopt;

  ControlAck ack;
  auto flag = [&](const char* key, std::optional<bool>& out) {
    auto it = j.find(key);
    if (it != j.end() && it->is_boolean()) out = it->get<bool>();
  };
  auto number = [&](const char* key, std::optional<double>& out) {
    auto it = j.find(key);
    if (it != j.end() && it->is_number()) out = it->get<double>();
  };
  flag("paused", ack.paused);
  flag("race_started", ack.race_started);
  flag("race_finished", ack.race_finished);
  number("speed_multiplier", ack.speed_multiplier);
  number("time", ack.time);
  return ack;
}

std::string encode_reset() {
  return json{{"type", "reset"}}.dump();
}

std::string encode_start_request(const Weather& w) {
  return json{
    {"rain", std::clamp(w.rain, 0.0, 1.0)},
    {"track_temp", std::clamp(w.track_temp, 15.0, 50.0)},
    {"wind", std::clamp(w.wind, 0.0, 20.0)},
  }.dump();
}

std::string encode_speed_request(double speed) {
  return json{{"speed", speed}}.dump();
}

} // namespace f1live
