#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <f1live/track_geom.hpp>

namespace f1live {

struct Rgb {
  std::uint8_t r{255};
  std::uint8_t g{255};
  std::uint8_t b{255};
  bool operator==(const Rgb&) const = default;
};

// "#rrggbb" or "rrggbb"; nullopt otherwise.
std::optional<Rgb> parse_hex_color(const std::string& s);

struct PitstopRecord {
  int lap{};
  std::string tyre;
};

// One car's instantaneous truth as pushed by the server.
struct CarState {
  std::string name;
  Rgb color{};
  int race_position{};        // 1-based rank
  int laps_completed{};

  bool has_position{false};   // x/y present on the wire
  Vec2 position{};            // world meters
  std::optional<double> angle;// radians, 0 = +x, CCW positive

  double speed_kmh{};
  int gear{};
  double rpm{};
  double throttle{};          // [0,1]
  double brake{};             // [0,1]
  std::string tyre_compound;
  double tyre_wear{};         // [0,1]
  double tyre_temp{};
  double fuel{};
  bool on_pit{false};
  int pitstop_count{};
  std::vector<PitstopRecord> pitstop_history;

  bool drs_active{false};
  double ers_energy{};
  bool overtaking{false};
  double total_time{};
  double time_interval{};     // s behind leader
  double distance_interval{}; // m relative to leader
};

struct Weather {
  double rain{0.0};           // [0,1]
  double track_temp{25.0};
  double wind{0.0};
};

// Server-side error/incident event (race_events[]).
struct ServerRaceEvent {
  double time{};
  std::string driver;
  std::string message;
  std::string error_type;
  double time_loss{};
  int lap{};
};

struct UndercutResult {
  std::string vs;
  double time_gain{};
  int position_before{};
  int position_after{};
  int position_change{};
};

struct UndercutSummary {
  std::string car;
  int lap{};
  std::string old_tyre;
  std::string new_tyre;
  double pit_time{};
  std::vector<UndercutResult> undercuts;
};

// Authoritative race state, replaced wholesale on each push.
struct RaceSnapshot {
  double sim_time{0.0};
  std::vector<CarState> cars{};
  Weather weather{};
  int total_laps{15};
  std::map<std::string, int> tyre_distribution{};
  bool race_started{false};
  bool race_finished{false};
  std::vector<ServerRaceEvent> race_events{};
  std::vector<UndercutSummary> undercut_summary{};
};

// Static track payload, delivered once.
struct TrackPayload {
  std::vector<Vec2> points;
  double total_length{0.0};
};

// Helper: find car by name in a snapshot
inline const CarState* find_car(const RaceSnapshot& ss, const std::string& name) {
  for (const auto& c : ss.cars) if (c.name == name) return &c;
  return nullptr;
}

// True when race_position values form a permutation of 1..N.
bool positions_are_permutation(const RaceSnapshot& ss);

// "Dry", "Light Rain", "Medium Rain" or "Heavy Rain".
const char* weather_label(double rain);

// Highest completed lap count among cars (0 when empty).
int leader_laps(const RaceSnapshot& ss);

} // namespace f1live
