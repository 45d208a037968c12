#include <f1live/camera.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace f1live {

namespace {

const RenderCar* find_render_car(const RenderFrame& f, const std::string& name) {
  for (const auto& c : f.cars) if (c.name == name) return &c;
  return nullptr;
}

Vec2 lerp2(Vec2 a, Vec2 b, double t) { return {lerp(a.x, b.x, t), lerp(a.y, b.y, t)}; }

// Free 3D camera: z offset per unit of height (never exactly straight down).
constexpr double kFreeTilt = 0.15;

} // namespace

ViewController::ViewController(ViewParams p) : params_(p) {
  if (params_.zoom_min > params_.zoom_max) std::swap(params_.zoom_min, params_.zoom_max);
  params_.default_zoom = std::clamp(params_.default_zoom, params_.zoom_min, params_.zoom_max);
  zoom_ = params_.default_zoom;
}

void ViewController::set_home(Vec2 center) { home_ = center; }

Vec2 ViewController::center() const {
  const Vec2 base = (mode_ == ViewMode::Follow) ? follow_point_ : home_;
  return {base.x + pan_.x, base.y + pan_.y};
}

void ViewController::release_follow_() {
  // leave the view where it is
  const Vec2 here = center();
  mode_ = ViewMode::Free;
  followed_.clear();
  pan_ = {here.x - home_.x, here.y - home_.y};
}

void ViewController::select_car(const std::string& name) {
  if (name.empty()) return;
  if (mode_ == ViewMode::Follow && followed_ == name) {
    release_follow_();
    return;
  }
  const Vec2 here = center();
  mode_ = ViewMode::Follow;
  followed_ = name;
  follow_point_ = here;
  pan_ = {};
}

void ViewController::reset_view() {
  mode_ = ViewMode::Free;
  followed_.clear();
  pan_ = {};
  follow_point_ = home_;
  zoom_ = params_.default_zoom;
}

void ViewController::zoom_by(double delta) { set_zoom(zoom_ + delta); }

void ViewController::set_zoom(double z) {
  if (!std::isfinite(z)) return;
  zoom_ = std::clamp(z, params_.zoom_min, params_.zoom_max);
}

void ViewController::pan_by(Vec2 d) {
  pan_.x += d.x;
  pan_.y += d.y;
}

void ViewController::update(const RenderFrame& frame) {
  const bool new_epoch = frame.epoch != epoch_;
  epoch_ = frame.epoch;
  if (mode_ != ViewMode::Follow) return;
  // a car that is not in this frame keeps the view where it was, unless the
  // race restarted without it
  const RenderCar* car = find_render_car(frame, followed_);
  if (!car) {
    if (new_epoch) release_follow_();
    return;
  }
  follow_point_ = lerp2(follow_point_, {car->position.x, car->position.z}, params_.follow_lerp);
}

ScreenTransform fit_view(const TrackBounds& bounds, double width, double height,
                         double padding_px, double zoom, Vec2 center) {
  const Vec2 size = bounds.size();
  const double sx = (width - 2.0 * padding_px) / std::max(size.x, 1.0);
  const double sy = (height - 2.0 * padding_px) / std::max(size.y, 1.0);
  ScreenTransform t;
  t.scale = std::max(std::min(sx, sy), 1e-3) * zoom;
  t.world_origin = center;
  t.screen_origin = {width * 0.5, height * 0.5};
  return t;
}

ScreenTransform fit_minimap(const TrackBounds& bounds, double width, double height, Vec2 panel_origin) {
  const Vec2 size = bounds.size();
  ScreenTransform t;
  t.scale = std::min(width / std::max(size.x, 1.0), height / std::max(size.y, 1.0));
  t.world_origin = bounds.min;
  t.screen_origin = panel_origin;
  return t;
}

std::optional<TrackBounds> bounds_of(const std::vector<RenderCar>& cars) {
  if (cars.empty()) return std::nullopt;
  TrackBounds b;
  b.min = { std::numeric_limits<double>::max(),  std::numeric_limits<double>::max()};
  b.max = {-std::numeric_limits<double>::max(), -std::numeric_limits<double>::max()};
  for (const auto& c : cars) {
    b.min.x = std::min(b.min.x, c.position.x);
    b.min.y = std::min(b.min.y, c.position.z);
    b.max.x = std::max(b.max.x, c.position.x);
    b.max.y = std::max(b.max.y, c.position.z);
  }
  return b;
}

Vec2 field_center(const std::vector<RenderCar>& cars, Vec2 fallback) {
  if (cars.empty()) return fallback;
  Vec2 sum{};
  for (const auto& c : cars) { sum.x += c.position.x; sum.y += c.position.z; }
  const double n = static_cast<double>(cars.size());
  return {sum.x / n, sum.y / n};
}

double CameraRig3D::free_height(const TrackBounds& bounds) {
  const Vec2 s = bounds.size();
  return std::max(std::max(s.x, s.y) * 0.12, 50.0) * 1.2;
}

void CameraRig3D::update(const ViewController& view, const RenderFrame& frame, const TrackBounds& bounds) {
  const double rate = view.params().follow_lerp;
  CameraPose want;

  const RenderCar* car = view.mode() == ViewMode::Follow ? find_render_car(frame, view.followed()) : nullptr;
  if (car) {
    // elevated, offset ahead of the car along its heading, looking back at it
    want.position = {car->position.x + std::cos(car->heading) * kFollowOffset,
                     kFollowHeight,
                     car->position.z + std::sin(car->heading) * kFollowOffset};
    want.target = car->position;
  } else {
    const Vec2 c = view.center();
    const double h = free_height(bounds) / view.zoom();
    want.target = {c.x, 0.0, c.y};
    want.position = {c.x, h, c.y + h * kFreeTilt};
  }

  if (!placed_) {
    snap(want);
    return;
  }
  pose_.position = lerp(pose_.position, want.position, rate);
  pose_.target = lerp(pose_.target, want.target, rate);
}

} // namespace f1live
