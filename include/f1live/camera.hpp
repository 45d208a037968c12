#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <f1live/interp.hpp>
#include <f1live/track_geom.hpp>
#include <f1live/track_surface.hpp>

namespace f1live {

struct ViewParams {
  double follow_lerp = 0.05;
  double zoom_min = 0.5;
  double zoom_max = 3.0;
  double default_zoom = 1.0;
};

enum class ViewMode { Free, Follow };

// Decides which part of the world is shown. Free: the user's pan/zoom.
// Follow: the centre is pulled every frame toward the followed car.
// All positions are world (x, y) meters.
class ViewController {
public:
  explicit ViewController(ViewParams p = {});

  // Default framing; typically the track centre.
  void set_home(Vec2 center);

  // Selecting the followed car again returns to Free.
  void select_car(const std::string& name);
  // Back to exactly the default framing; idempotent.
  void reset_view();

  void zoom_by(double delta);
  void set_zoom(double z);
  void pan_by(Vec2 world_delta);

  // One render frame. A followed car missing from the first frame of a new
  // epoch drops the view back to Free.
  void update(const RenderFrame& frame);

  ViewMode mode() const { return mode_; }
  const std::string& followed() const { return followed_; }
  double zoom() const { return zoom_; }
  Vec2 center() const;
  Vec2 home() const { return home_; }
  const ViewParams& params() const { return params_; }

private:
  void release_follow_();

  ViewParams params_;
  ViewMode mode_{ViewMode::Free};
  std::string followed_;
  Vec2 home_{};
  Vec2 pan_{};          // offset from home (Free) or from the follow point
  Vec2 follow_point_{}; // smoothed car position
  double zoom_{1.0};
  std::uint64_t epoch_{0};
};

// world <-> screen for a top-down view: screen = (p - world_origin) * scale + screen_origin
struct ScreenTransform {
  double scale{1.0};        // px per meter
  Vec2 world_origin{};
  Vec2 screen_origin{};

  Vec2 to_screen(Vec2 p) const {
    return {(p.x - world_origin.x) * scale + screen_origin.x,
            (p.y - world_origin.y) * scale + screen_origin.y};
  }
  Vec2 to_world(Vec2 s) const {
    return {(s.x - screen_origin.x) / scale + world_origin.x,
            (s.y - screen_origin.y) / scale + world_origin.y};
  }
};

// Main 2D view: fits `bounds` inside the viewport with `padding_px` on every
// side at zoom 1, then zooms about the view centre.
ScreenTransform fit_view(const TrackBounds& bounds, double width, double height,
                         double padding_px, double zoom, Vec2 center);

// Minimap: whole track, no padding, anchored at the panel's top-left.
ScreenTransform fit_minimap(const TrackBounds& bounds, double width, double height, Vec2 panel_origin);

// Bounds of the car positions, for framing when no track exists.
std::optional<TrackBounds> bounds_of(const std::vector<RenderCar>& cars);

// Mean position of the field, or `fallback` when no car is present.
Vec2 field_center(const std::vector<RenderCar>& cars, Vec2 fallback);

// Perspective camera for the 3D painter.
struct CameraPose {
  Vec3 position{};
  Vec3 target{};
};

// Follow pose: kFollowHeight above the car and kFollowOffset along its heading,
// so the camera looks back down at the car's nose.
class CameraRig3D {
public:
  static constexpr double kFollowOffset = 8.0;
  static constexpr double kFollowHeight = 20.0;

  // Height of the free camera for a track of the given extent.
  static double free_height(const TrackBounds& bounds);

  // Places the camera at the free pose without blending.
  void snap(const CameraPose& pose) { pose_ = pose; placed_ = true; }

  // Blends toward the follow pose (Follow) or above the view centre (Free).
  void update(const ViewController& view, const RenderFrame& frame, const TrackBounds& bounds);

  const CameraPose& pose() const { return pose_; }

private:
  CameraPose pose_{};
  bool placed_{false};
};

} // namespace f1live
