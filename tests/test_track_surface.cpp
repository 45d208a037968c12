#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <vector>

#include <f1live/track_surface.hpp>

using Catch::Approx;
using namespace f1live;

static TrackPayload circle_track(std::size_t n, double radius) {
  TrackPayload t;
  for (std::size_t i = 0; i < n; ++i) {
    const double a = kTAU * double(i) / double(n);
    t.points.push_back({radius * std::cos(a), radius * std::sin(a)});
  }
  t.total_length = kTAU * radius;
  return t;
}

TEST_CASE("TrackSurface: one ring per centreline point plus a closing ring") {
  const auto ts = TrackSurface::build(circle_track(64, 100.0));
  REQUIRE(ts.has_value());

  const RibbonMesh& m = ts->surface();
  REQUIRE(m.rings() == 65);
  REQUIRE(m.vertices.size() == 130);
  REQUIRE(m.normals.size() == m.vertices.size());
  REQUIRE(m.uvs.size() == m.vertices.size());
  REQUIRE(m.indices.size() == 64 * 6);
  for (auto idx : m.indices) REQUIRE(idx < m.vertices.size());

  // the closing ring coincides with the first
  REQUIRE(m.vertices[128].x == Approx(m.vertices[0].x).margin(1e-6));
  REQUIRE(m.vertices[128].z == Approx(m.vertices[0].z).margin(1e-6));
}

TEST_CASE("TrackSurface: ribbon is full width with no degenerate edges") {
  const auto ts = TrackSurface::build(circle_track(48, 120.0));
  REQUIRE(ts.has_value());
  const RibbonMesh& m = ts->surface();

  for (std::size_t r = 0; r < m.rings(); ++r) {
    const Vec3& l = m.vertices[r * 2];
    const Vec3& rr = m.vertices[r * 2 + 1];
    REQUIRE(distance(l, rr) == Approx(15.0).margin(1e-6));
    if (r + 1 < m.rings()) {
      REQUIRE(distance(l, m.vertices[(r + 1) * 2]) > 1e-3);
    }
  }
}

TEST_CASE("TrackSurface: all heights are non-negative") {
  const auto ts = TrackSurface::build(circle_track(80, 200.0));
  REQUIRE(ts.has_value());
  for (const RibbonMesh* m : {&ts->surface(), &ts->kerb(0), &ts->kerb(1)}) {
    REQUIRE_FALSE(m->empty());
    for (const auto& v : m->vertices) REQUIRE(v.y >= 0.0);
  }
  for (std::size_t i = 0; i < 2000; ++i) REQUIRE(synthetic_elevation(i) >= 0.5);
}

TEST_CASE("TrackSurface: kerbs sit beside the asphalt, lifted") {
  SurfaceParams p;
  p.track_segments = 10;
  const auto ts = TrackSurface::build(circle_track(32, 100.0), p);
  REQUIRE(ts.has_value());

  REQUIRE(ts->surface().rings() == 11);
  REQUIRE(ts->kerb(0).rings() == 401);   // kerb_segments wins when larger

  const RibbonMesh& s = ts->surface();
  const Vec3 s_mid = (s.vertices[0] + s.vertices[1]) * 0.5;
  for (std::size_t side = 0; side < 2; ++side) {
    const RibbonMesh& k = ts->kerb(side);
    const Vec3 k_mid = (k.vertices[0] + k.vertices[1]) * 0.5;
    REQUIRE(std::hypot(k_mid.x - s_mid.x, k_mid.z - s_mid.z) == Approx(p.kerb_offset).margin(1e-6));
    REQUIRE(k_mid.y == Approx(s_mid.y + p.kerb_height).margin(1e-9));
    REQUIRE(k.uvs.back().y == Approx(20.0));
  }
}

TEST_CASE("TrackSurface: bad point lists are rejected") {
  TrackPayload two;
  two.points = {{0.0, 0.0}, {10.0, 0.0}};
  REQUIRE_FALSE(TrackSurface::build(two).has_value());

  TrackPayload dupes;
  dupes.points = {{0.0, 0.0}, {0.0, 0.0}, {5.0, 0.0}, {5.0, 0.0}, {0.0, 0.0}};
  REQUIRE_FALSE(TrackSurface::build(dupes).has_value());

  TrackPayload nan;
  nan.points = {{0.0, 0.0}, {std::nan(""), 1.0}, {10.0, 0.0}};
  REQUIRE_FALSE(TrackSurface::build(nan).has_value());
}

TEST_CASE("TrackSurface: repeated closing point is dropped") {
  auto t = circle_track(20, 50.0);
  t.points.push_back(t.points.front());
  const auto ts = TrackSurface::build(t);
  REQUIRE(ts.has_value());
  REQUIRE(ts->centerline().size() == 20);
}

TEST_CASE("TrackSurface: bounds and length") {
  const auto ts = TrackSurface::build(circle_track(64, 100.0));
  REQUIRE(ts.has_value());
  REQUIRE(ts->bounds().min.x == Approx(-100.0));
  REQUIRE(ts->bounds().max.x == Approx(100.0));
  REQUIRE(ts->bounds().center().x == Approx(0.0).margin(1e-9));
  REQUIRE(ts->bounds().center().y == Approx(0.0).margin(1e-9));
  REQUIRE(ts->total_length() == Approx(kTAU * 100.0));

  TrackPayload no_len = circle_track(64, 100.0);
  no_len.total_length = 0.0;
  const auto ts2 = TrackSurface::build(no_len);
  REQUIRE(ts2->total_length() > 0.0);
}

TEST_CASE("TrackSurface: locate snaps elevation and clamps far positions") {
  const auto ts = TrackSurface::build(circle_track(64, 100.0));
  REQUIRE(ts.has_value());
  REQUIRE(ts->clamp_radius() == Approx(10.0));

  SECTION("on a centreline point") {
    const Vec2 p = ts->centerline()[5];
    const TrackLocation loc = ts->locate(p.x, p.y);
    REQUIRE_FALSE(loc.clamped);
    REQUIRE(loc.nearest_index == 5);
    REQUIRE(loc.position.y == Approx(synthetic_elevation(5)));
  }

  SECTION("inside the tolerance band") {
    const TrackLocation loc = ts->locate(105.0, 0.0);
    REQUIRE_FALSE(loc.clamped);
    REQUIRE(loc.position.x == Approx(105.0));
    REQUIRE(loc.position.z == Approx(0.0).margin(1e-9));
  }

  SECTION("15 m off the track is pulled back to 10 m") {
    const TrackLocation loc = ts->locate(115.0, 0.0);
    REQUIRE(loc.clamped);
    REQUIRE(loc.distance_from_center == Approx(15.0));
    REQUIRE(loc.position.x == Approx(110.0));
    REQUIRE(loc.position.z == Approx(0.0).margin(1e-9));
  }
}
