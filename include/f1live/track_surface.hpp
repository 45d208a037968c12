#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include <f1live/snap.hpp>
#include <f1live/track_geom.hpp>

namespace f1live {

struct SurfaceParams {
  double track_width = 15.0;   // meters, full width
  double tolerance = 2.5;      // extra slack before a car is pulled back on track
  double kerb_offset = 8.0;    // kerb centre distance from centreline
  double kerb_width = 0.5;
  double kerb_height = 0.15;   // lift above the asphalt
  int track_segments = 0;      // 0 = one ring per centreline point
  int kerb_segments = 400;
};

// Triangle strip laid out as pairs (left, right) per ring.
struct RibbonMesh {
  std::vector<Vec3> vertices;
  std::vector<Vec3> normals;
  std::vector<Vec2> uvs;
  std::vector<std::uint32_t> indices;

  std::size_t rings() const { return vertices.size() / 2; }
  bool empty() const { return vertices.empty(); }
};

struct TrackBounds {
  Vec2 min{};
  Vec2 max{};
  Vec2 center() const { return {(min.x + max.x) * 0.5, (min.y + max.y) * 0.5}; }
  Vec2 size() const { return {max.x - min.x, max.y - min.y}; }
};

// Result of snapping an arbitrary world (x,y) query onto the rendered track.
struct TrackLocation {
  Vec3 position{};             // render space (x, elevation, y)
  std::size_t nearest_index{};
  double distance_from_center{};
  bool clamped{false};
};

// Synthetic, deterministic, non-negative height for centreline index i.
double synthetic_elevation(std::size_t index);

// Builds a ribbon of `segments` quads (segments + 1 rings, the last closing the
// loop) offset `center_offset` from the spline, `half_width` to each side.
RibbonMesh build_ribbon(const ClosedSpline& spline,
                        int segments,
                        double center_offset,
                        double half_width,
                        double lift,
                        double uv_repeat);

// Static renderable description of a track, built once per race.
class TrackSurface {
public:
  // nullopt when fewer than 3 distinct finite points are supplied.
  static std::optional<TrackSurface> build(const TrackPayload& payload,
                                           const SurfaceParams& params = {});

  const std::vector<Vec2>& centerline() const { return centerline_; }
  const ClosedSpline& spline() const { return spline_; }
  const RibbonMesh& surface() const { return surface_; }
  const RibbonMesh& kerb(std::size_t side) const { return kerbs_[side < 2 ? side : 1]; }
  const TrackBounds& bounds() const { return bounds_; }
  const SurfaceParams& params() const { return params_; }
  double total_length() const { return total_length_; }

  double half_width() const { return params_.track_width * 0.5; }
  double clamp_radius() const { return half_width() + params_.tolerance; }

  double elevation_at(std::size_t index) const;

  // Nearest-point lookup with inverse-distance elevation blend between the two
  // closest centreline points; positions beyond clamp_radius() are pulled back
  // along the centre->query direction.
  TrackLocation locate(double x, double y) const;

private:
  TrackSurface() = default;

  SurfaceParams params_{};
  std::vector<Vec2> centerline_;
  ClosedSpline spline_;
  RibbonMesh surface_;
  std::array<RibbonMesh, 2> kerbs_{};
  TrackBounds bounds_{};
  double total_length_{0.0};
};

} // namespace f1live
