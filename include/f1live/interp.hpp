#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include <f1live/snap.hpp>
#include <f1live/track_geom.hpp>
#include <f1live/track_surface.hpp>

namespace f1live {

// Tuning of the per-car smoothing. The angle offset and the height offset are
// empirically calibrated for the renderer; keep them configurable.
struct MotionParams {
  double base_factor = 0.2;
  double scale_factor = 0.15;
  double max_factor = 0.6;
  double height_offset = 0.8;       // car body above the surface
  double angle_offset = kPI / 2.0;  // render yaw = -heading + angle_offset
  double min_motion = 0.01;         // displacement below this is "stationary"
  double max_turn_rate = 0.4;
  double turn_gain = 2.0;
  double idle_turn_rate = 0.2;
  double flat_elevation = 0.5;      // surface height when no track exists
};

// Server heading (0 = +x, CCW positive) <-> render yaw about the up axis.
inline double to_render_angle(double heading, const MotionParams& p) { return -heading + p.angle_offset; }
inline double to_world_heading(double render_angle, const MotionParams& p) { return p.angle_offset - render_angle; }

// clamp(base + min(distance/10, 1.5) * scale, base, max); always < 1.
double adaptive_factor(double distance, const MotionParams& p);

// Fraction of the (wrapped) heading error removed this frame.
double turn_rate(double wrapped_diff, double moved, const MotionParams& p);

enum class MotionPhase { Unseen, Initialized, Tracking };

// Interpolated, render-only view of one car.
struct CarMotion {
  MotionPhase phase{MotionPhase::Unseen};
  Vec3 target{};
  Vec3 position{};
  Vec3 previous{};            // position one frame ago
  double target_angle{0.0};
  double angle{0.0};          // render yaw, unwrapped so consecutive frames stay continuous
  bool clamped{false};        // target was pulled back onto the track
};

// One entry of the per-frame renderer contract.
struct RenderCar {
  std::string name;
  Vec3 position{};
  double angle{0.0};          // render yaw
  double heading{0.0};        // same yaw in world convention, for top-down painters
  bool selected{false};
  Rgb color{};
  int race_position{0};
  bool on_pit{false};
};

struct RenderFrame {
  double sim_time{0.0};
  std::uint64_t epoch{0};
  std::vector<RenderCar> cars;          // snapshot order
  const TrackSurface* track{nullptr};   // may be null: draw without a surface
};

class MotionInterpolator {
public:
  explicit MotionInterpolator(MotionParams p = {}) : params_(p) {}

  // Advances every car by one render frame toward `snap`. A new epoch discards
  // all per-car state; cars missing from the snapshot are dropped. The same
  // snapshot may be passed on many consecutive frames.
  const RenderFrame& update(const RaceSnapshot& snap,
                            const TrackSurface* track,
                            std::uint64_t epoch,
                            const std::string& selected = {});

  void reset();

  const RenderFrame& frame() const { return frame_; }
  const CarMotion* find(const std::string& name) const;
  std::size_t tracked() const { return cars_.size(); }
  const MotionParams& params() const { return params_; }

private:
  Vec3 target_for_(const CarState& c, const TrackSurface* track, bool& clamped) const;
  void step_(CarMotion& m, const CarState& c, const TrackSurface* track);

  MotionParams params_;
  std::unordered_map<std::string, CarMotion> cars_;
  std::uint64_t epoch_{0};
  bool has_epoch_{false};
  RenderFrame frame_{};
};

} // namespace f1live
