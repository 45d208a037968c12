#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <raylib.h>

#include <f1live/camera.hpp>
#include <f1live/config.hpp>
#include <f1live/control_client.hpp>
#include <f1live/effects.hpp>
#include <f1live/interp.hpp>
#include <f1live/race_store.hpp>
#include <f1live/transport.hpp>
#include <f1live/viewer/painters.hpp>

namespace f1live {

// RAII application: owns the connection, the race store and the view state,
// and renders the latest snapshot with the HUD once per frame.
class ViewerApp {
public:
  using Clock = std::chrono::steady_clock;

  explicit ViewerApp(const ViewerConfig& cfg);
  ~ViewerApp();
  ViewerApp(const ViewerApp&) = delete;
  ViewerApp& operator=(const ViewerApp&) = delete;

  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  void pump_network_(Clock::time_point now);
  void process_input_(Clock::time_point now);
  void process_mouse_(Clock::time_point now);
  void select_(const std::string& name, Clock::time_point now);
  std::string pick_car_(Vector2 mouse) const;

  // Rendering
  void render_frame_(Clock::time_point now);
  void draw_hud_(const RaceSnapshot& snap, Clock::time_point now);
  void draw_dashboard_(const RaceSnapshot& snap);
  void draw_race_log_();
  void draw_undercuts_(const RaceSnapshot& snap);
  void draw_lap_banner_(const RaceSnapshot& snap, Clock::time_point now);

  TrackBounds view_bounds_() const;
  ScreenTransform view_transform_() const;
  float pulse_(Clock::time_point now) const;

  ViewerConfig cfg_;

  // Data
  TransportChannel transport_;
  RaceStore store_;
  ControlClient control_;
  MotionInterpolator interp_;

  // View state
  ViewController view_;
  CameraRig3D rig_;
  EffectScheduler effects_;
  Canvas2DPainter canvas_;
  std::unique_ptr<Scene3DPainter> scene_;   // needs a GL context

  bool mode_3d_{false};
  bool labels_{true};
  Weather start_weather_{};

  bool was_connected_{false};
  std::uint64_t seen_epoch_{0};
  std::uint64_t seen_lap_changes_{0};
  std::uint64_t home_track_version_{0};

  // Mouse drag (pixels since press)
  bool dragging_{false};
  float drag_px_{0.0f};
};

} // namespace f1live
