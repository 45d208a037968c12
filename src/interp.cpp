#include <f1live/interp.hpp>
#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

namespace f1live {

double adaptive_factor(double distance, const MotionParams& p) {
  const double speed = std::min(distance / 10.0, 1.5);
  return std::clamp(p.base_factor + speed * p.scale_factor, p.base_factor, p.max_factor);
}

double turn_rate(double wrapped_diff, double moved, const MotionParams& p) {
  if (moved > p.min_motion) return std::min(p.max_turn_rate, std::fabs(wrapped_diff) * p.turn_gain);
  return p.idle_turn_rate;
}

void MotionInterpolator::reset() {
  cars_.clear();
  frame_.cars.clear();
}

const CarMotion* MotionInterpolator::find(const std::string& name) const {
  auto it = cars_.find(name);
  return it == cars_.end() ? nullptr : &it->second;
}

Vec3 MotionInterpolator::target_for_(const CarState& c, const TrackSurface* track, bool& clamped) const {
  if (!track) {
    clamped = false;
    return {c.position.x, params_.flat_elevation + params_.height_offset, c.position.y};
  }
  const TrackLocation loc = track->locate(c.position.x, c.position.y);
  clamped = loc.clamped;
  return {loc.position.x, loc.position.y + params_.height_offset, loc.position.z};
}

void MotionInterpolator::step_(CarMotion& m, const CarState& c, const TrackSurface* track) {
  m.target = target_for_(c, track, m.clamped);

  if (m.phase == MotionPhase::Unseen) {
    // first sighting: no blend, or the car would sweep in from the origin
    m.position = m.previous = m.target;
    m.target_angle = c.angle ? to_render_angle(*c.angle, params_) : 0.0;
    m.angle = m.target_angle;
    m.phase = MotionPhase::Initialized;
    return;
  }
  m.phase = MotionPhase::Tracking;

  m.previous = m.position;
  const double f = adaptive_factor(distance(m.position, m.target), params_);
  m.position = lerp(m.position, m.target, f);

  // displacement of the smoothed position, not of the raw samples
  const double dx = m.position.x - m.previous.x;
  const double dz = m.position.z - m.previous.z;
  const double moved = std::hypot(dx, dz);

  if (c.angle) {
    m.target_angle = to_render_angle(*c.angle, params_);
  } else if (moved > params_.min_motion) {
    m.target_angle = to_render_angle(std::atan2(dz, dx), params_);
  }

  const double diff = wrap_pi(m.target_angle - m.angle);
  m.angle += diff * turn_rate(diff, moved, params_);
}

const RenderFrame& MotionInterpolator::update(const RaceSnapshot& snap,
                                              const TrackSurface* track,
                                              std::uint64_t epoch,
                                              const std::string& selected) {
  if (has_epoch_ && epoch != epoch_) {
    spdlog::debug("interp: epoch {} -> {}, dropping {} cars", epoch_, epoch, cars_.size());
    cars_.clear();
  }
  epoch_ = epoch;
  has_epoch_ = true;

  // cars that left the snapshot lose their state
  for (auto it = cars_.begin(); it != cars_.end();) {
    if (!find_car(snap, it->first)) it = cars_.erase(it);
    else ++it;
  }

  frame_.sim_time = snap.sim_time;
  frame_.epoch = epoch;
  frame_.track = track;
  frame_.cars.clear();
  frame_.cars.reserve(snap.cars.size());

  for (const auto& c : snap.cars) {
    if (!c.has_position) continue;
    CarMotion& m = cars_[c.name];
    step_(m, c, track);

    RenderCar rc;
    rc.name = c.name;
    rc.position = m.position;
    rc.angle = m.angle;
    rc.heading = to_world_heading(m.angle, params_);
    rc.selected = !selected.empty() && c.name == selected;
    rc.color = c.color;
    rc.race_position = c.race_position;
    rc.on_pit = c.on_pit;
    frame_.cars.push_back(std::move(rc));
  }
  return frame_;
}

} // namespace f1live
