#include <f1live/track_surface.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <spdlog/spdlog.h>

namespace f1live {

namespace {

constexpr double kMinPointSpacing = 1e-9;
const Vec3 kWorldUp{0.0, 1.0, 0.0};

// Drops non-finite points, consecutive duplicates and a repeated closing point.
std::vector<Vec2> sanitize_centerline(const std::vector<Vec2>& in) {
  std::vector<Vec2> out;
  out.reserve(in.size());
  for (const auto& p : in) {
    if (!std::isfinite(p.x) || !std::isfinite(p.y)) continue;
    if (!out.empty() && distance(out.back(), p) <= kMinPointSpacing) continue;
    out.push_back(p);
  }
  while (out.size() > 1 && distance(out.front(), out.back()) <= kMinPointSpacing) {
    out.pop_back();
  }
  return out;
}

} // namespace

double synthetic_elevation(std::size_t index) {
  const double i = static_cast<double>(index);
  return std::abs(std::sin(i * 0.1) * 2.0) + std::abs(std::cos(i * 0.05) * 1.5) + 0.5;
}

RibbonMesh build_ribbon(const ClosedSpline& spline,
                        int segments,
                        double center_offset,
                        double half_width,
                        double lift,
                        double uv_repeat) {
  RibbonMesh m;
  if (spline.empty() || segments < 3) return m;

  const std::size_t rings = static_cast<std::size_t>(segments) + 1;
  m.vertices.reserve(rings * 2);
  m.normals.reserve(rings * 2);
  m.uvs.reserve(rings * 2);
  m.indices.reserve(static_cast<std::size_t>(segments) * 6);

  Vec3 last_binormal{1.0, 0.0, 0.0};
  for (std::size_t i = 0; i < rings; ++i) {
    const double t = double(i) / double(segments);
    const Vec3 point = spline.point_at(t);
    const Vec3 tangent = spline.tangent_at(t);

    // Fixed world-up keeps the ribbon free of twist.
    Vec3 binormal = cross(kWorldUp, tangent);
    if (binormal.length() < 1e-9) binormal = last_binormal;
    binormal = binormal.normalized();
    last_binormal = binormal;

    const Vec3 center = point + binormal * center_offset;
    Vec3 left  = center + binormal * half_width;
    Vec3 right = center + binormal * -half_width;
    left.y  = std::max(0.0, left.y + lift);
    right.y = std::max(0.0, right.y + lift);

    m.vertices.push_back(left);
    m.vertices.push_back(right);
    m.normals.push_back(kWorldUp);
    m.normals.push_back(kWorldUp);
    m.uvs.push_back({0.0, t * uv_repeat});
    m.uvs.push_back({1.0, t * uv_repeat});

    if (i + 1 < rings) {
      const auto base = static_cast<std::uint32_t>(i * 2);
      m.indices.insert(m.indices.end(), {base, base + 1, base + 2});
      m.indices.insert(m.indices.end(), {base + 1, base + 3, base + 2});
    }
  }
  return m;
}

std::optional<TrackSurface> TrackSurface::build(const TrackPayload& payload,
                                                const SurfaceParams& params) {
  auto pts = sanitize_centerline(payload.points);
  if (pts.size() < 3) {
    spdlog::warn("track: need at least 3 distinct points, got {} (raw {})",
                 pts.size(), payload.points.size());
    return std::nullopt;
  }

  TrackSurface ts;
  ts.params_ = params;
  ts.centerline_ = std::move(pts);

  std::vector<Vec3> ctrl;
  ctrl.reserve(ts.centerline_.size());
  TrackBounds b{ ts.centerline_.front(), ts.centerline_.front() };
  for (std::size_t i = 0; i < ts.centerline_.size(); ++i) {
    const Vec2& p = ts.centerline_[i];
    ctrl.push_back({p.x, synthetic_elevation(i), p.y});
    b.min.x = std::min(b.min.x, p.x); b.min.y = std::min(b.min.y, p.y);
    b.max.x = std::max(b.max.x, p.x); b.max.y = std::max(b.max.y, p.y);
  }
  ts.bounds_ = b;
  ts.spline_.set_points(std::move(ctrl));

  ts.total_length_ = payload.total_length > 0.0 ? payload.total_length : ts.spline_.length();

  const int n = static_cast<int>(ts.centerline_.size());
  const int segments = params.track_segments > 0 ? params.track_segments : n;
  const int kerb_segments = std::max(params.kerb_segments, segments);

  ts.surface_ = build_ribbon(ts.spline_, segments, 0.0, params.track_width * 0.5, 0.0, 1.0);
  ts.kerbs_[0] = build_ribbon(ts.spline_, kerb_segments, -params.kerb_offset,
                              params.kerb_width * 0.5, params.kerb_height, 20.0);
  ts.kerbs_[1] = build_ribbon(ts.spline_, kerb_segments, params.kerb_offset,
                              params.kerb_width * 0.5, params.kerb_height, 20.0);

  spdlog::info("track: {} points, length {:.1f} m, {} rings", n, ts.total_length_,
               ts.surface_.rings());
  return ts;
}

double TrackSurface::elevation_at(std::size_t index) const {
  if (centerline_.empty()) return 0.0;
  return synthetic_elevation(index % centerline_.size());
}

TrackLocation TrackSurface::locate(double x, double y) const {
  TrackLocation loc;
  loc.position = {x, 0.0, y};
  if (centerline_.empty()) return loc;

  // Two closest centreline points (squared distance).
  double d1 = std::numeric_limits<double>::max();
  double d2 = std::numeric_limits<double>::max();
  std::size_t i1 = 0, i2 = 0;
  for (std::size_t i = 0; i < centerline_.size(); ++i) {
    const double dx = centerline_[i].x - x;
    const double dy = centerline_[i].y - y;
    const double d = dx*dx + dy*dy;
    if (d < d1) {
      d2 = d1; i2 = i1;
      d1 = d;  i1 = i;
    } else if (d < d2) {
      d2 = d; i2 = i;
    }
  }

  const double dist1 = std::sqrt(d1);
  const double dist2 = std::sqrt(d2);
  const double total = dist1 + dist2;
  const double e1 = elevation_at(i1);
  const double e2 = elevation_at(i2);
  const double elevation = total > 0.001 ? e1 * (dist2 / total) + e2 * (dist1 / total) : e1;

  loc.nearest_index = i1;
  loc.distance_from_center = dist1;
  loc.position.y = elevation;

  const double radius = clamp_radius();
  if (dist1 > radius) {
    const Vec2& c = centerline_[i1];
    const double ratio = radius / dist1;
    loc.position.x = c.x + (x - c.x) * ratio;
    loc.position.z = c.y + (y - c.y) * ratio;
    loc.clamped = true;
  }
  return loc;
}

} // namespace f1live
