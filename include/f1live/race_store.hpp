#pragma once
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <f1live/protocol.hpp>
#include <f1live/snap.hpp>
#include <f1live/track_fetch.hpp>
#include <f1live/track_surface.hpp>

namespace f1live {

enum class LogKind { Overtake, Drs, PitEntry, PitExit, Incident };

const char* log_kind_name(LogKind k);

struct RaceLogEntry {
  LogKind kind{LogKind::Overtake};
  double time{};
  std::string driver;
  std::string message;
  std::string details;
  double time_loss{};        // incidents only
};

// Holds the latest authoritative snapshot plus the state derived from
// consecutive snapshots. Single writer; readers take a shared_ptr and keep
// whatever snapshot they got for the whole frame.
class RaceStore {
public:
  using Sender = std::function<bool(std::string_view)>;

  static constexpr std::size_t kMaxLogEntries = 50;
  // A snapshot older than the current one is a restart when a reset is
  // pending, when its time is below kRestartTime, or when it is more than the
  // restart threshold behind. Anything else is a late tick and is dropped.
  static constexpr double kRestartTime = 1.0;
  static constexpr double kDefaultRestartThreshold = 5.0;

  explicit RaceStore(Sender send = {}, SurfaceParams params = {});

  // Malformed or unrecognised text is dropped (debug log only), and so are
  // late state ticks.
  bool ingest(std::string_view text);
  void ingest(InboundMessage msg);

  // Never null; an empty race before the first state message.
  std::shared_ptr<const RaceSnapshot> current_snapshot() const { return snapshot_; }

  // Sends {"type":"reset"} and publishes a local override with
  // race_started = race_finished = false and sim_time = 0. The override sits
  // in a single slot until the next authoritative snapshot replaces it.
  // Repeated calls while the override is pending change nothing.
  void request_reset();
  bool reset_pending() const { return reset_pending_; }

  // Incremented whenever derived and interpolated state must be discarded
  // (server restarted the race, i.e. sim time went backwards).
  std::uint64_t epoch() const { return epoch_; }
  void set_restart_threshold(double seconds) { restart_threshold_ = seconds; }

  // --- track ---
  void set_track_fetcher(std::unique_ptr<TrackFetcher> fetcher) { fetcher_ = std::move(fetcher); }
  // Drives the fallback fetch; call once per frame.
  void poll();
  bool has_track_payload() const { return track_payload_.has_value(); }
  const std::optional<TrackPayload>& track_payload() const { return track_payload_; }
  // nullptr while no usable track exists.
  const TrackSurface* track() const { return surface_ ? &*surface_ : nullptr; }
  std::uint64_t track_version() const { return track_version_; }

  // --- derived ---
  const std::deque<RaceLogEntry>& race_log() const { return log_; }
  // Places gained (+) or lost (-) by each car against the previous snapshot.
  const std::map<std::string, int>& position_changes() const { return position_changes_; }
  int leader_lap() const { return leader_lap_; }
  // Bumped each time the leader starts a new lap.
  std::uint64_t lap_changes() const { return lap_changes_; }

  std::uint64_t snapshots_received() const { return snapshots_; }
  std::uint64_t messages_dropped() const { return dropped_; }

private:
  void apply_state_(RaceSnapshot s);
  void apply_track_(TrackPayload t, const char* source);
  void derive_(const RaceSnapshot& prev, const RaceSnapshot& cur);
  void ingest_server_events_(const RaceSnapshot& cur);
  void push_log_(RaceLogEntry e);
  void clear_derived_();

  Sender send_;
  SurfaceParams params_;

  std::shared_ptr<const RaceSnapshot> snapshot_;
  // last snapshot that came from the server (never the reset override)
  std::shared_ptr<const RaceSnapshot> authoritative_;
  bool reset_pending_{false};
  std::uint64_t epoch_{0};
  double restart_threshold_{kDefaultRestartThreshold};

  std::unique_ptr<TrackFetcher> fetcher_;
  std::optional<TrackPayload> track_payload_;
  std::optional<TrackSurface> surface_;
  std::uint64_t track_version_{0};

  std::deque<RaceLogEntry> log_;
  std::map<std::string, int> position_changes_;
  std::size_t server_events_seen_{0};
  int leader_lap_{0};
  std::uint64_t lap_changes_{0};
  bool permutation_warned_{false};

  std::uint64_t snapshots_{0};
  std::uint64_t dropped_{0};
};

} // namespace f1live
