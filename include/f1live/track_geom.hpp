#pragma once
#include <vector>
#include <cmath>
#include <cstddef>
#include <algorithm>
#include <numbers>

namespace f1live {

// Constant naming convention (kCamelCase)
inline constexpr double kPI  = std::numbers::pi_v<double>;
inline constexpr double kTAU = 2.0 * kPI;

struct Vec2 {
  double x{};
  double y{};
};

// Render space: Y is up, world (x,y) maps to (x,z).
struct Vec3 {
  double x{};
  double y{};
  double z{};

  Vec3 operator+(const Vec3& o) const { return {x + o.x, y + o.y, z + o.z}; }
  Vec3 operator-(const Vec3& o) const { return {x - o.x, y - o.y, z - o.z}; }
  Vec3 operator*(double k) const { return {x * k, y * k, z * k}; }

  double length() const { return std::sqrt(x*x + y*y + z*z); }
  Vec3 normalized() const {
    const double l = length();
    return l > 0.0 ? Vec3{x / l, y / l, z / l} : Vec3{};
  }
};

inline Vec3 cross(const Vec3& a, const Vec3& b) {
  return { a.y*b.z - a.z*b.y, a.z*b.x - a.x*b.z, a.x*b.y - a.y*b.x };
}

inline double distance(const Vec2& a, const Vec2& b) {
  return std::hypot(b.x - a.x, b.y - a.y);
}

inline double distance(const Vec3& a, const Vec3& b) { return (b - a).length(); }

inline double lerp(double a, double b, double t) { return a + (b - a) * t; }

inline Vec3 lerp(const Vec3& a, const Vec3& b, double t) {
  return { lerp(a.x, b.x, t), lerp(a.y, b.y, t), lerp(a.z, b.z, t) };
}

// Wraps an angle difference into (-pi, pi].
inline double wrap_pi(double a) {
  a = std::fmod(a + kPI, kTAU);
  if (a <= 0.0) a += kTAU;
  return a - kPI;
}

// Closed uniform Catmull-Rom spline through 3D control points with an
// arc-length lookup table, so that point_at(u) advances at constant speed.
class ClosedSpline {
public:
  ClosedSpline() = default;
  explicit ClosedSpline(std::vector<Vec3> ctrl, int arc_divisions = 0) {
    set_points(std::move(ctrl), arc_divisions);
  }

  void set_points(std::vector<Vec3> ctrl, int arc_divisions = 0) {
    ctrl_ = std::move(ctrl);
    cum_.clear();
    length_ = 0.0;
    if (ctrl_.size() < 3) { ctrl_.clear(); return; }
    if (arc_divisions <= 0) arc_divisions = static_cast<int>(ctrl_.size()) * 8;
    build_arc_table_(arc_divisions);
  }

  bool empty() const { return ctrl_.size() < 3; }
  double length() const { return length_; }
  const std::vector<Vec3>& control_points() const { return ctrl_; }

  // t in [0,1) over the whole loop, uniform in control-point index.
  Vec3 point(double t) const {
    std::size_t seg; double u;
    locate_(t, seg, u);
    return catmullRom_(at_(seg - 1), at_(seg), at_(seg + 1), at_(seg + 2), u);
  }

  Vec3 tangent(double t) const {
    std::size_t seg; double u;
    locate_(t, seg, u);
    return catmullRomDerivative_(at_(seg - 1), at_(seg), at_(seg + 1), at_(seg + 2), u).normalized();
  }

  // u in [0,1] as a fraction of arc length.
  Vec3 point_at(double u) const { return point(u_to_t(u)); }
  Vec3 tangent_at(double u) const { return tangent(u_to_t(u)); }

  double u_to_t(double u) const {
    if (empty() || length_ <= 0.0) return 0.0;
    u = std::clamp(u, 0.0, 1.0);
    const double target = u * length_;
    auto it = std::lower_bound(cum_.begin(), cum_.end(), target);
    std::size_t i1 = std::clamp<std::size_t>(std::distance(cum_.begin(), it), 1, cum_.size() - 1);
    std::size_t i0 = i1 - 1;
    const double seg_len = cum_[i1] - cum_[i0];
    const double f = seg_len > 0.0 ? (target - cum_[i0]) / seg_len : 0.0;
    const double div = static_cast<double>(cum_.size() - 1);
    return (static_cast<double>(i0) + f) / div;
  }

private:
  const Vec3& at_(std::size_t i) const { return ctrl_[i % ctrl_.size()]; }

  void locate_(double t, std::size_t& seg, double& u) const {
    const double n = static_cast<double>(ctrl_.size());
    double p = std::fmod(t, 1.0);
    if (p < 0.0) p += 1.0;
    p *= n;
    double whole = std::floor(p);
    seg = static_cast<std::size_t>(whole) % ctrl_.size();
    u = p - whole;
    // at_(seg - 1) must not underflow
    seg += ctrl_.size();
  }

  // Uniform Catmull–Rom (C1 continuous), stable and simple.
  static Vec3 catmullRom_(const Vec3& P0, const Vec3& P1, const Vec3& P2, const Vec3& P3, double u) {
    const double u2 = u*u;
    const double u3 = u2*u;
    // Basis matrix (0.5 * [ -1  3 -3  1;  2 -5  4 -1; -1  0  1  0;  0  2  0  0 ]) applied to [P0 P1 P2 P3]
    const Vec3 a0 = P0*-1.0 + P1*3.0 - P2*3.0 + P3;
    const Vec3 a1 = P0*2.0 - P1*5.0 + P2*4.0 - P3;
    const Vec3 a2 = P2 - P0;
    const Vec3 a3 = P1*2.0;
    return (a0*u3 + a1*u2 + a2*u + a3) * 0.5;
  }

  static Vec3 catmullRomDerivative_(const Vec3& P0, const Vec3& P1, const Vec3& P2, const Vec3& P3, double u) {
    const Vec3 a0 = P0*-1.0 + P1*3.0 - P2*3.0 + P3;
    const Vec3 a1 = P0*2.0 - P1*5.0 + P2*4.0 - P3;
    const Vec3 a2 = P2 - P0;
    return (a0*(3.0*u*u) + a1*(2.0*u) + a2) * 0.5;
  }

  void build_arc_table_(int divisions) {
    cum_.resize(static_cast<std::size_t>(divisions) + 1);
    cum_[0] = 0.0;
    Vec3 prev = point(0.0);
    for (int i = 1; i <= divisions; ++i) {
      const Vec3 cur = point(double(i) / double(divisions));
      cum_[i] = cum_[i-1] + distance(prev, cur);
      prev = cur;
    }
    length_ = cum_.back();
  }

  std::vector<Vec3> ctrl_;
  std::vector<double> cum_;
  double length_{0.0};
};

} // namespace f1live
