#include <f1live/viewer/painters.hpp>
#include <algorithm>
#include <cmath>

#include <raylib.h>
#include <rlgl.h>
#include <spdlog/spdlog.h>

namespace f1live {

namespace {

// radians -> degrees using our kPI constant
static constexpr double kRadToDeg = 180.0 / kPI;

static constexpr Color kAsphalt{40, 40, 46, 255};
static constexpr Color kEdge{30, 30, 34, 255};
static constexpr Color kKerbRed{200, 70, 70, 255};
static constexpr Color kKerbWhite{235, 235, 235, 255};
static constexpr Color kGold{255, 215, 0, 255};

static Vector2 to_v2(Vec2 p) { return {float(p.x), float(p.y)}; }
static Vector3 to_v3(const Vec3& p) { return {float(p.x), float(p.y), float(p.z)}; }

static float length2f(Vector2 v) { return std::sqrt(v.x*v.x + v.y*v.y); }

// Shoelace sign (CCW positive, CW negative)
static float polygon_area_sign(const std::vector<Vec2>& pts) {
  double A = 0.0;
  for (size_t i = 0; i < pts.size(); ++i) {
    const Vec2& a = pts[i];
    const Vec2& b = pts[(i + 1) % pts.size()];
    A += a.x * b.y - b.x * a.y;
  }
  return (A >= 0.0) ? +1.0f : -1.0f;
}

} // namespace

Camera3D to_camera3d(const CameraPose& pose) {
  Camera3D cam{};
  cam.position = to_v3(pose.position);
  cam.target = to_v3(pose.target);
  cam.up = {0.0f, 1.0f, 0.0f};
  cam.fovy = 45.0f;
  cam.projection = CAMERA_PERSPECTIVE;
  return cam;
}

// ---- Canvas2DPainter ----

void Canvas2DPainter::draw(const RenderFrame& frame, const ScreenTransform& xf, bool labels, float pulse) const {
  if (frame.track) draw_track_(*frame.track, xf);
  for (const auto& car : frame.cars) draw_car_(car, xf, labels, pulse);
}

void Canvas2DPainter::draw_track_(const TrackSurface& track, const ScreenTransform& xf) const {
  const auto& pts = track.centerline();
  if (pts.size() < 3) return;
  const std::size_t n = pts.size();

  const float half_w_px = float(track.half_width() * xf.scale);

  // Asphalt ribbon (thick segment lines, round joints)
  for (std::size_t i = 0; i < n; ++i) {
    const Vector2 a = to_v2(xf.to_screen(pts[i]));
    const Vector2 b = to_v2(xf.to_screen(pts[(i + 1) % n]));
    DrawLineEx(a, b, half_w_px * 2.0f, kAsphalt);
    DrawCircleV(a, half_w_px, kAsphalt);
  }
  // Centre line
  for (std::size_t i = 0; i < n; ++i) {
    const Vector2 a = to_v2(xf.to_screen(pts[i]));
    const Vector2 b = to_v2(xf.to_screen(pts[(i + 1) % n]));
    DrawLineEx(a, b, 1.0f, Color{70, 70, 78, 255});
  }

  // Kerbs on both edges (alternate red/white short dashes)
  const float orient = polygon_area_sign(pts);
  const float kerb_dash_px = 14.0f;
  const float kerb_thick_px = std::max(2.0f, float(track.params().kerb_width * xf.scale) * 4.0f);
  const float kerb_off_px = float(track.params().kerb_offset * xf.scale);
  for (float side : {-1.0f, 1.0f}) {
    bool red = true;
    for (std::size_t i = 0; i < n; ++i) {
      const Vector2 a = to_v2(xf.to_screen(pts[i]));
      const Vector2 b = to_v2(xf.to_screen(pts[(i + 1) % n]));
      Vector2 ab = { b.x - a.x, b.y - a.y };
      const float len = length2f(ab);
      if (len < 1.0f) continue;
      Vector2 t = { ab.x / len, ab.y / len };
      Vector2 nrm = { -t.y * orient * side, t.x * orient * side };
      const Vector2 edge_a = { a.x + nrm.x * kerb_off_px, a.y + nrm.y * kerb_off_px };
      float consumed = 0.0f;
      while (consumed < len) {
        float dash = std::min(kerb_dash_px, len - consumed);
        Vector2 p0 = { edge_a.x + t.x * consumed,          edge_a.y + t.y * consumed };
        Vector2 p1 = { edge_a.x + t.x * (consumed + dash), edge_a.y + t.y * (consumed + dash) };
        DrawLineEx(p0, p1, kerb_thick_px, red ? kKerbRed : kKerbWhite);
        consumed += dash;
        red = !red;
      }
    }
  }

  // Start/finish checker (at segment 0->1)
  const Vector2 a = to_v2(xf.to_screen(pts[0]));
  const Vector2 b = to_v2(xf.to_screen(pts[1]));
  Vector2 ab = { b.x - a.x, b.y - a.y };
  const float len = length2f(ab);
  if (len > 0.1f) {
    Vector2 t = { ab.x / len, ab.y / len };
    Vector2 nrm = { -t.y, t.x };
    const int squares = 10;
    for (int i = 0; i < squares; ++i) {
      Color c = (i % 2 == 0) ? Color{240,240,240,255} : Color{20,20,22,255};
      float off = -half_w_px + (2.0f*half_w_px) * ((i + 0.5f) / squares);
      Vector2 p0 = { a.x + nrm.x * off, a.y + nrm.y * off };
      Vector2 p1 = { p0.x + t.x * 8.0f, p0.y + t.y * 8.0f };
      DrawLineEx(p0, p1, 6.0f, c);
    }
  }
}

void Canvas2DPainter::draw_car_(const RenderCar& car, const ScreenTransform& xf, bool label, float pulse) const {
  const Vector2 pos = to_v2(xf.to_screen({car.position.x, car.position.z}));
  const Color col = to_color(car.color, car.on_pit ? 140 : 255);

  float len = 12.0f, wid = 6.0f;
  if (car.selected) { len *= 1.1f; wid *= 1.1f; }
  const float c = std::cos(float(car.heading)), s = std::sin(float(car.heading));
  // forward (c, s), side (-s, c); screen y grows downward like world y
  Vector2 nose  = { pos.x + c*len,          pos.y + s*len };
  Vector2 tailL = { pos.x - c*len - s*wid,  pos.y - s*len + c*wid };
  Vector2 tailR = { pos.x - c*len + s*wid,  pos.y - s*len - c*wid };
  DrawTriangle(nose, tailL, tailR, col);
  DrawCircleV(pos, 3.0f, col); // colored marker at center

  if (car.selected) {
    DrawCircleLinesV(pos, 16.0f + 6.0f * pulse, Fade(kGold, 1.0f - 0.6f * pulse));
  }
  if (label) {
    DrawText(TextFormat("P%d %s", car.race_position, car.name.c_str()),
             int(pos.x) + 10, int(pos.y) - 18, 12, Color{230,230,235,255});
  }
}

void Canvas2DPainter::draw_minimap(const RenderFrame& frame, const TrackBounds& bounds,
                                   Vec2 origin, float width, float height) const {
  DrawRectangle(int(origin.x) - 6, int(origin.y) - 22, int(width) + 12, int(height) + 28, Color{24,24,28,220});
  DrawText("Mini Map", int(origin.x), int(origin.y) - 18, 12, Color{200,200,210,255});

  const ScreenTransform xf = fit_minimap(bounds, width, height, origin);
  if (frame.track) {
    const auto& pts = frame.track->centerline();
    for (std::size_t i = 0; i < pts.size(); ++i) {
      DrawLineEx(to_v2(xf.to_screen(pts[i])), to_v2(xf.to_screen(pts[(i + 1) % pts.size()])),
                 2.0f, Color{120,120,130,255});
    }
  }
  for (const auto& car : frame.cars) {
    const Vector2 p = to_v2(xf.to_screen({car.position.x, car.position.z}));
    DrawCircleV(p, car.selected ? 4.0f : 3.0f, to_color(car.color));
    if (car.selected) DrawCircleLinesV(p, 6.0f, kGold);
  }
}

// ---- Scene3DPainter ----

Scene3DPainter::Scene3DPainter() {
  // red/white bands along the kerb (v runs along the track)
  Image img = GenImageChecked(8, 64, 8, 32, kKerbRed, kKerbWhite);
  kerb_texture_ = LoadTextureFromImage(img);
  UnloadImage(img);
  SetTextureWrap(kerb_texture_, TEXTURE_WRAP_REPEAT);
}

Scene3DPainter::~Scene3DPainter() {
  unload_();
  if (kerb_texture_.id != 0) UnloadTexture(kerb_texture_);
}

void Scene3DPainter::unload_() {
  for (GpuRibbon* r : {&surface_, &kerbs_[0], &kerbs_[1]}) {
    if (r->loaded) UnloadModel(r->model);
    *r = GpuRibbon{};
  }
}

void Scene3DPainter::set_track(const TrackSurface* track, std::uint64_t version) {
  if (track == track_ && version == version_) return;
  unload_();
  track_ = track;
  version_ = version;
  if (!track_) return;

  upload_(track_->surface(), kAsphalt, nullptr, surface_);
  upload_(track_->kerb(0), WHITE, &kerb_texture_, kerbs_[0]);
  upload_(track_->kerb(1), WHITE, &kerb_texture_, kerbs_[1]);
}

bool Scene3DPainter::upload_(const RibbonMesh& src, Color tint, const Texture2D* texture, GpuRibbon& out) {
  if (src.empty()) return false;
  // raylib meshes use 16-bit indices
  if (src.vertices.size() > 65535) {
    spdlog::warn("scene: ribbon with {} vertices exceeds 16-bit indices, drawing unbatched", src.vertices.size());
    return false;
  }

  Mesh mesh{};
  mesh.vertexCount = static_cast<int>(src.vertices.size());
  mesh.triangleCount = static_cast<int>(src.indices.size() / 3);
  mesh.vertices  = static_cast<float*>(MemAlloc(unsigned(mesh.vertexCount * 3 * sizeof(float))));
  mesh.normals   = static_cast<float*>(MemAlloc(unsigned(mesh.vertexCount * 3 * sizeof(float))));
  mesh.texcoords = static_cast<float*>(MemAlloc(unsigned(mesh.vertexCount * 2 * sizeof(float))));
  mesh.indices   = static_cast<unsigned short*>(MemAlloc(unsigned(src.indices.size() * sizeof(unsigned short))));

  for (std::size_t i = 0; i < src.vertices.size(); ++i) {
    mesh.vertices[i*3 + 0] = float(src.vertices[i].x);
    mesh.vertices[i*3 + 1] = float(src.vertices[i].y);
    mesh.vertices[i*3 + 2] = float(src.vertices[i].z);
    mesh.normals[i*3 + 0]  = float(src.normals[i].x);
    mesh.normals[i*3 + 1]  = float(src.normals[i].y);
    mesh.normals[i*3 + 2]  = float(src.normals[i].z);
    mesh.texcoords[i*2 + 0] = float(src.uvs[i].x);
    mesh.texcoords[i*2 + 1] = float(src.uvs[i].y);
  }
  for (std::size_t i = 0; i < src.indices.size(); ++i) {
    mesh.indices[i] = static_cast<unsigned short>(src.indices[i]);
  }

  UploadMesh(&mesh, false);
  out.model = LoadModelFromMesh(mesh);
  out.model.materials[0].maps[MATERIAL_MAP_DIFFUSE].color = tint;
  if (texture) out.model.materials[0].maps[MATERIAL_MAP_DIFFUSE].texture = *texture;
  out.loaded = true;
  return true;
}

void Scene3DPainter::draw_immediate_(const RibbonMesh& src, Color tint) {
  for (std::size_t i = 0; i + 2 < src.indices.size(); i += 3) {
    DrawTriangle3D(to_v3(src.vertices[src.indices[i]]),
                   to_v3(src.vertices[src.indices[i + 1]]),
                   to_v3(src.vertices[src.indices[i + 2]]), tint);
  }
}

void Scene3DPainter::draw(const RenderFrame& frame, const CameraPose& pose, bool labels, float pulse) const {
  const Camera3D cam = to_camera3d(pose);
  BeginMode3D(cam);

  // Ground under the track
  Vec2 ground_c{pose.target.x, pose.target.z};
  float ground = 2000.0f;
  if (track_) {
    ground_c = track_->bounds().center();
    const Vec2 sz = track_->bounds().size();
    ground = float(std::max(sz.x, sz.y) * 1.5 + 100.0);
  }
  DrawPlane({float(ground_c.x), -0.5f, float(ground_c.y)}, {ground, ground}, Color{30, 60, 30, 255});

  if (track_) {
    rlDisableBackfaceCulling();
    const GpuRibbon* ribbons[3] = {&surface_, &kerbs_[0], &kerbs_[1]};
    const RibbonMesh* meshes[3] = {&track_->surface(), &track_->kerb(0), &track_->kerb(1)};
    for (int i = 0; i < 3; ++i) {
      if (ribbons[i]->loaded) DrawModel(ribbons[i]->model, {0.0f, 0.0f, 0.0f}, 1.0f, WHITE);
      else draw_immediate_(*meshes[i], i == 0 ? kAsphalt : kKerbRed);
    }
    rlEnableBackfaceCulling();
  }

  // Cars: boxes with the long axis on local +Z, yawed about +Y
  for (const auto& car : frame.cars) {
    const float k = car.selected ? 1.1f + 0.1f * pulse : 1.0f;
    rlPushMatrix();
    rlTranslatef(float(car.position.x), float(car.position.y), float(car.position.z));
    rlRotatef(float(car.angle * kRadToDeg), 0.0f, 1.0f, 0.0f);
    DrawCube({0.0f, 0.0f, 0.0f}, 2.0f * k, 1.0f * k, 4.6f * k, to_color(car.color, car.on_pit ? 140 : 255));
    DrawCubeWires({0.0f, 0.0f, 0.0f}, 2.0f * k, 1.0f * k, 4.6f * k, car.selected ? kGold : Color{20,20,22,255});
    // nose marker
    DrawCube({0.0f, 0.3f * k, 2.0f * k}, 1.2f * k, 0.3f * k, 0.6f * k, Color{240,240,240,255});
    rlPopMatrix();
  }

  EndMode3D();

  if (labels) {
    for (const auto& car : frame.cars) {
      const Vector2 s = GetWorldToScreen(to_v3(car.position + Vec3{0.0, 2.5, 0.0}), cam);
      DrawText(car.name.c_str(), int(s.x) - MeasureText(car.name.c_str(), 12) / 2, int(s.y), 12,
               car.selected ? kGold : Color{230,230,235,255});
    }
  }
}

} // namespace f1live
