#include <f1live/race_store.hpp>
#include <utility>
#include <variant>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace f1live {

const char* log_kind_name(LogKind k) {
  switch (k) {
    case LogKind::Overtake: return "overtake";
    case LogKind::Drs:      return "drs";
    case LogKind::PitEntry: return "pit-in";
    case LogKind::PitExit:  return "pit-out";
    case LogKind::Incident: return "incident";
  }
  return "?";
}

RaceStore::RaceStore(Sender send, SurfaceParams params)
  : send_(std::move(send)), params_(params), snapshot_(std::make_shared<const RaceSnapshot>()) {}

bool RaceStore::ingest(std::string_view text) {
  auto msg = decode_message(text);
  if (!msg) {
    ++dropped_;
    spdlog::debug("store: dropped malformed message ({} bytes)", text.size());
    return false;
  }
  ingest(std::move(*msg));
  return true;
}

void RaceStore::ingest(InboundMessage msg) {
  if (auto* t = std::get_if<TrackMessage>(&msg)) {
    apply_track_(std::move(t->track), "stream");
  } else if (auto* s = std::get_if<StateMessage>(&msg)) {
    apply_state_(std::move(s->snapshot));
  }
}

void RaceStore::apply_state_(RaceSnapshot s) {
  const std::shared_ptr<const RaceSnapshot> prev = authoritative_;

  bool restarted = false;
  if (prev && s.sim_time < prev->sim_time) {
    const bool back_to_start = s.sim_time < kRestartTime && prev->sim_time >= kRestartTime;
    const bool big_jump = prev->sim_time - s.sim_time > restart_threshold_;
    if (!reset_pending_ && !back_to_start && !big_jump) {
      // a late tick; the newer snapshot stays current
      ++dropped_;
      spdlog::debug("store: dropped stale snapshot (t {:.2f} < {:.2f})", s.sim_time, prev->sim_time);
      return;
    }
    restarted = true;
    ++epoch_;
    clear_derived_();
    spdlog::info("store: race restarted (t {:.1f} -> {:.1f}), epoch {}", prev->sim_time, s.sim_time, epoch_);
  }

  // the override, if any, is superseded here: replaced, never merged
  reset_pending_ = false;

  auto next = std::make_shared<const RaceSnapshot>(std::move(s));

  if (!next->cars.empty() && !positions_are_permutation(*next)) {
    if (!permutation_warned_) {
      spdlog::warn("store: race positions are not a permutation of 1..{}", next->cars.size());
      permutation_warned_ = true;
    }
  }

  if (prev && !restarted) derive_(*prev, *next);
  else position_changes_.clear();
  ingest_server_events_(*next);

  const int lap = leader_laps(*next);
  if (lap > leader_lap_) {
    leader_lap_ = lap;
    ++lap_changes_;
  }

  snapshot_ = next;
  authoritative_ = std::move(next);
  ++snapshots_;
}

void RaceStore::request_reset() {
  if (reset_pending_) {
    spdlog::debug("store: reset already pending");
    return;
  }

  const bool sent = send_ && send_(encode_reset());
  if (!sent) spdlog::warn("store: reset request could not be sent");

  auto overridden = std::make_shared<RaceSnapshot>(*snapshot_);
  overridden->race_started = false;
  overridden->race_finished = false;
  overridden->sim_time = 0.0;
  snapshot_ = std::move(overridden);
  reset_pending_ = true;
}

void RaceStore::poll() {
  if (!fetcher_ || track_payload_) return;
  fetcher_->start();
  if (auto t = fetcher_->poll()) apply_track_(std::move(*t), "http");
}

void RaceStore::apply_track_(TrackPayload t, const char* source) {
  spdlog::info("store: track received via {} ({} points, {:.0f} m)", source, t.points.size(), t.total_length);
  surface_ = TrackSurface::build(t, params_);
  if (!surface_) spdlog::warn("store: track unusable, rendering without a surface");
  track_payload_ = std::move(t);
  ++track_version_;
}

void RaceStore::derive_(const RaceSnapshot& prev, const RaceSnapshot& cur) {
  position_changes_.clear();
  for (const auto& car : cur.cars) {
    const CarState* was = find_car(prev, car.name);
    if (!was) continue;

    const int change = (was->race_position > 0 && car.race_position > 0)
                         ? was->race_position - car.race_position : 0;
    position_changes_[car.name] = change;

    if (change > 0) {
      push_log_({LogKind::Overtake, cur.sim_time, car.name,
                 fmt::format("{} overtook P{} -> P{}", car.name, was->race_position, car.race_position), {}, 0.0});
    }
    if (!was->drs_active && car.drs_active) {
      push_log_({LogKind::Drs, cur.sim_time, car.name, fmt::format("{} activated DRS", car.name), {}, 0.0});
    }
    if (!was->on_pit && car.on_pit) {
      push_log_({LogKind::PitEntry, cur.sim_time, car.name,
                 fmt::format("{} entered pit lane", car.name),
                 fmt::format("Lap {}, Tyre: {}", car.laps_completed + 1, car.tyre_compound), 0.0});
    }
    if (was->pitstop_count < car.pitstop_count && !car.on_pit) {
      push_log_({LogKind::PitExit, cur.sim_time, car.name,
                 fmt::format("{} exited pit lane", car.name),
                 fmt::format("New tyres: {}", car.tyre_compound), 0.0});
    }
  }
}

void RaceStore::ingest_server_events_(const RaceSnapshot& cur) {
  // the server list only grows within a race; a shorter list is a new race
  if (cur.race_events.size() < server_events_seen_) server_events_seen_ = 0;
  for (std::size_t i = server_events_seen_; i < cur.race_events.size(); ++i) {
    const auto& e = cur.race_events[i];
    push_log_({LogKind::Incident, e.time, e.driver, e.message,
               fmt::format("Lap {}, -{:.2f}s", e.lap, e.time_loss), e.time_loss});
  }
  server_events_seen_ = cur.race_events.size();
}

void RaceStore::push_log_(RaceLogEntry e) {
  log_.push_back(std::move(e));
  while (log_.size() > kMaxLogEntries) log_.pop_front();
}

void RaceStore::clear_derived_() {
  log_.clear();
  position_changes_.clear();
  server_events_seen_ = 0;
  leader_lap_ = 0;
  permutation_warned_ = false;
}

} // namespace f1live
