#pragma once
#include <cstdint>
#include <string>

#include <raylib.h>

#include <f1live/camera.hpp>
#include <f1live/interp.hpp>
#include <f1live/track_surface.hpp>

namespace f1live {

inline Color to_color(const Rgb& c, unsigned char a = 255) { return Color{c.r, c.g, c.b, a}; }

// 45 degree perspective camera, +Y up.
Camera3D to_camera3d(const CameraPose& pose);

// Top-down canvas painter. Consumes the same RenderFrame as Scene3DPainter.
class Canvas2DPainter {
public:
  void draw(const RenderFrame& frame, const ScreenTransform& xf, bool labels, float pulse) const;

  // Track outline and car dots inside a panel.
  void draw_minimap(const RenderFrame& frame, const TrackBounds& bounds,
                    Vec2 origin, float width, float height) const;

private:
  void draw_track_(const TrackSurface& track, const ScreenTransform& xf) const;
  void draw_car_(const RenderCar& car, const ScreenTransform& xf, bool label, float pulse) const;
};

// Perspective painter: uploads the ribbon meshes once per track and draws
// cars as oriented boxes. Must be created after the window exists.
class Scene3DPainter {
public:
  Scene3DPainter();
  ~Scene3DPainter();
  Scene3DPainter(const Scene3DPainter&) = delete;
  Scene3DPainter& operator=(const Scene3DPainter&) = delete;

  // Rebuilds GPU meshes when the track changes; nullptr clears them.
  void set_track(const TrackSurface* track, std::uint64_t version);

  void draw(const RenderFrame& frame, const CameraPose& pose, bool labels, float pulse) const;

private:
  struct GpuRibbon {
    Model model{};
    bool loaded{false};
  };

  static bool upload_(const RibbonMesh& src, Color tint, const Texture2D* texture, GpuRibbon& out);
  static void draw_immediate_(const RibbonMesh& src, Color tint);
  void unload_();

  const TrackSurface* track_{nullptr};
  std::uint64_t version_{0};
  GpuRibbon surface_{};
  GpuRibbon kerbs_[2]{};
  Texture2D kerb_texture_{};
};

} // namespace f1live
