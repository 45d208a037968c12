#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include <f1live/viewer/app.hpp>
#include <f1live/track_fetch.hpp>
#include <f1live/ws_url.hpp>

namespace f1live {

namespace {

static constexpr const char* kLapBanner = "lap_banner";
static constexpr const char* kSelectPulse = "select_pulse";

static constexpr float kDragThresholdPx = 4.0f;
static constexpr float kPickRadiusPx = 16.0f;
static constexpr double kViewPaddingPx = 60.0;
static constexpr float kMinimapW = 200.0f;
static constexpr float kMinimapH = 150.0f;

static const char* speedLabel(double w) {
  if (w == 0.5) return "0.5x";
  if (w == 1.0) return "1x";
  if (w == 2.0) return "2x";
  if (w == 5.0) return "5x";
  return "custom";
}

// Time formatting helpers
static void fmt_time(double s, char* out, int cap) {
  if (cap <= 0 || out == nullptr) return;
  if (s < 0.0 || !std::isfinite(s)) { std::snprintf(out, (size_t)cap, "%s", "--"); return; }
  int minutes = (int)(s / 60.0);
  double rem  = s - minutes * 60.0;
  int secs    = (int)rem;
  int ms      = (int)((rem - secs) * 1000.0 + 0.5);
  if (ms >= 1000) { ms -= 1000; ++secs; }
  if (minutes > 0) std::snprintf(out, (size_t)cap, "%d:%02d.%03d", minutes, secs, ms);
  else             std::snprintf(out, (size_t)cap, "%d.%03d", secs, ms);
}
static void fmt_gap(double s, char* out, int cap) {
  if (cap <= 0 || out == nullptr) return;
  if (s <= 0.0) { std::snprintf(out, (size_t)cap, "%s", "--"); return; }
  std::snprintf(out, (size_t)cap, "+%.3f", s);
}

static Color positionColor(int pos) {
  return (pos==1) ? Color{255,215,0,255}
       : (pos==2) ? Color{192,192,192,255}
       : (pos==3) ? Color{205,127,50,255}
                  : Color{200,200,210,255};
}

static Color logColor(LogKind k) {
  switch (k) {
    case LogKind::Overtake: return Color{120,200,255,255};
    case LogKind::Drs:      return Color{ 80,220,120,255};
    case LogKind::PitEntry:
    case LogKind::PitExit:  return Color{241,196, 15,255};
    case LogKind::Incident: return Color{231, 76, 60,255};
  }
  return Color{200,200,210,255};
}

// --- HUD layout (keep in sync with draw_hud_) ---
static constexpr int kHUD_LINE1_Y    = 20;  // size 20
static constexpr int kHUD_LINE2_Y    = 46;  // size 18
static constexpr int kHUD_LINE3_Y    = 72;  // size 14
static constexpr int kHUD_LINE4_Y    = 92;  // size 14
static constexpr int kHUD_BOTTOM_PAD = 24;

static std::vector<const CarState*> by_position(const RaceSnapshot& snap) {
  std::vector<const CarState*> cars;
  cars.reserve(snap.cars.size());
  for (const auto& c : snap.cars) cars.push_back(&c);
  std::stable_sort(cars.begin(), cars.end(), [](const CarState* a, const CarState* b) {
    return a->race_position < b->race_position;
  });
  return cars;
}

static ReconnectPolicy policy_from(const ViewerConfig& cfg) {
  return ReconnectPolicy{ReconnectPolicy::Millis{cfg.reconnect_base_ms},
                         ReconnectPolicy::Millis{cfg.reconnect_cap_ms}};
}

static TransportChannel::ConnectionFactory websocket_factory(const std::string& url, long timeout_s) {
  if (!parse_ws_url(url)) {
    spdlog::error("viewer: invalid stream url '{}'", url);
    return {};
  }
  return [url, timeout_s]() { return Connection::create_websocket(url, timeout_s); };
}

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(const ViewerConfig& cfg)
  : cfg_(cfg),
    transport_(websocket_factory(cfg.ws_url, cfg.http_timeout_s), policy_from(cfg)),
    store_([this](std::string_view m) { return transport_.send(m); }, cfg.surface),
    control_(cfg.resolved_http_base(), cfg.http_timeout_s),
    interp_(cfg.motion),
    view_(cfg.view) {
  transport_.subscribe([this](std::string_view text) { store_.ingest(text); });
  store_.set_restart_threshold(cfg_.restart_threshold_s);
  store_.set_track_fetcher(std::make_unique<TrackFetcher>(
      TrackFetcher::http(cfg_.resolved_http_base(), cfg_.http_timeout_s)));
}

ViewerApp::~ViewerApp() = default;

int ViewerApp::run() {
  SetConfigFlags(FLAG_MSAA_4X_HINT | FLAG_WINDOW_RESIZABLE);
  InitWindow(cfg_.window_width, cfg_.window_height, "f1live - Viewer");
  SetTargetFPS(cfg_.target_fps);
  SetExitKey(KEY_ESCAPE);
  scene_ = std::make_unique<Scene3DPainter>();

  spdlog::info("viewer: streaming from {} (http {})", cfg_.ws_url, cfg_.resolved_http_base());
  transport_.start(Clock::now());

  while (!WindowShouldClose()) {
    const auto now = Clock::now();
    pump_network_(now);
    process_input_(now);
    render_frame_(now);
  }

  transport_.stop();
  // GPU resources go before the context
  scene_.reset();
  CloseWindow();
  return 0;
}

void ViewerApp::pump_network_(Clock::time_point now) {
  transport_.poll(now);
  store_.poll();

  const bool connected = transport_.connected();
  if (connected && !was_connected_) control_.request_status();
  was_connected_ = connected;

  // failures are logged by the client
  for (const auto& r : control_.poll()) {
    if (r.ok) spdlog::debug("control: {} ok", control_kind_name(r.kind));
  }

  if (store_.epoch() != seen_epoch_) {
    seen_epoch_ = store_.epoch();
    effects_.cancel(kLapBanner);
    seen_lap_changes_ = store_.lap_changes();
  }
  if (store_.lap_changes() != seen_lap_changes_) {
    seen_lap_changes_ = store_.lap_changes();
    effects_.schedule(kLapBanner, now, std::chrono::milliseconds{2000});
  }

  if (store_.track_version() != home_track_version_) {
    home_track_version_ = store_.track_version();
    if (const TrackSurface* t = store_.track()) view_.set_home(t->bounds().center());
    if (scene_) scene_->set_track(store_.track(), store_.track_version());
  }

  effects_.expire(now);
}

void ViewerApp::select_(const std::string& name, Clock::time_point now) {
  if (name.empty()) return;
  view_.select_car(name);
  if (view_.mode() == ViewMode::Follow) {
    effects_.schedule(kSelectPulse, now, std::chrono::milliseconds{1200});
  } else {
    effects_.cancel(kSelectPulse);
  }
}

void ViewerApp::process_input_(Clock::time_point now) {
  if (IsKeyPressed(KEY_V)) mode_3d_ = !mode_3d_;
  if (IsKeyPressed(KEY_L)) labels_ = !labels_;
  if (IsKeyPressed(KEY_C)) {
    view_.reset_view();
    effects_.cancel(kSelectPulse);
  }

  // Zoom
  if (IsKeyPressed(KEY_W) || IsKeyPressed(KEY_KP_ADD))      view_.zoom_by(+0.1);
  if (IsKeyPressed(KEY_S) || IsKeyPressed(KEY_KP_SUBTRACT)) view_.zoom_by(-0.1);
  const float wheel = GetMouseWheelMove();
  if (wheel != 0.0f) view_.zoom_by(0.1 * wheel);

  // 1..9 select P1..P9, 0 selects P10
  static const int kSelectKeys[10] = {KEY_ONE, KEY_TWO, KEY_THREE, KEY_FOUR, KEY_FIVE,
                                      KEY_SIX, KEY_SEVEN, KEY_EIGHT, KEY_NINE, KEY_ZERO};
  const auto snap = store_.current_snapshot();
  const auto ordered = by_position(*snap);
  for (int i = 0; i < 10; ++i) {
    if (IsKeyPressed(kSelectKeys[i]) && i < (int)ordered.size()) select_(ordered[i]->name, now);
  }

  // Race control
  if (IsKeyPressed(KEY_R)) store_.request_reset();
  if (IsKeyPressed(KEY_ENTER)) control_.start_race(start_weather_);
  if (IsKeyPressed(KEY_P)) {
    if (control_.paused()) control_.resume();
    else control_.pause();
  }
  if (IsKeyPressed(KEY_LEFT_BRACKET))  control_.set_speed(control_.slower_step());
  if (IsKeyPressed(KEY_RIGHT_BRACKET)) control_.set_speed(control_.faster_step());

  // Start weather
  if (IsKeyPressed(KEY_F1)) start_weather_.rain = std::max(0.0, start_weather_.rain - 0.1);
  if (IsKeyPressed(KEY_F2)) start_weather_.rain = std::min(1.0, start_weather_.rain + 0.1);
  if (IsKeyPressed(KEY_F3)) start_weather_.track_temp = std::max(15.0, start_weather_.track_temp - 1.0);
  if (IsKeyPressed(KEY_F4)) start_weather_.track_temp = std::min(50.0, start_weather_.track_temp + 1.0);
  if (IsKeyPressed(KEY_F5)) start_weather_.wind = std::max(0.0, start_weather_.wind - 1.0);
  if (IsKeyPressed(KEY_F6)) start_weather_.wind = std::min(20.0, start_weather_.wind + 1.0);

  process_mouse_(now);
}

void ViewerApp::process_mouse_(Clock::time_point now) {
  if (IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
    dragging_ = true;
    drag_px_ = 0.0f;
  }
  if (dragging_ && IsMouseButtonDown(MOUSE_BUTTON_LEFT)) {
    const Vector2 d = GetMouseDelta();
    drag_px_ += std::fabs(d.x) + std::fabs(d.y);
    if (drag_px_ > kDragThresholdPx && (d.x != 0.0f || d.y != 0.0f)) {
      const double scale = view_transform_().scale;
      view_.pan_by({-d.x / scale, -d.y / scale});
    }
  }
  if (dragging_ && IsMouseButtonReleased(MOUSE_BUTTON_LEFT)) {
    dragging_ = false;
    // a click, not a drag
    if (drag_px_ <= kDragThresholdPx) select_(pick_car_(GetMousePosition()), now);
  }
}

std::string ViewerApp::pick_car_(Vector2 mouse) const {
  const RenderFrame& frame = interp_.frame();
  const ScreenTransform xf = view_transform_();
  const Camera3D cam = to_camera3d(rig_.pose());

  std::string best;
  float best_d = kPickRadiusPx;
  for (const auto& car : frame.cars) {
    Vector2 s{};
    if (mode_3d_) {
      s = GetWorldToScreen({float(car.position.x), float(car.position.y), float(car.position.z)}, cam);
    } else {
      const Vec2 p = xf.to_screen({car.position.x, car.position.z});
      s = {float(p.x), float(p.y)};
    }
    const float d = std::hypot(s.x - mouse.x, s.y - mouse.y);
    if (d < best_d) { best_d = d; best = car.name; }
  }
  return best;
}

TrackBounds ViewerApp::view_bounds_() const {
  if (const TrackSurface* t = store_.track()) return t->bounds();
  if (auto b = bounds_of(interp_.frame().cars)) return *b;
  return TrackBounds{{-100.0, -100.0}, {100.0, 100.0}};
}

ScreenTransform ViewerApp::view_transform_() const {
  return fit_view(view_bounds_(), GetScreenWidth(), GetScreenHeight(), kViewPaddingPx,
                  view_.zoom(), view_.center());
}

float ViewerApp::pulse_(Clock::time_point now) const {
  const auto p = effects_.progress(kSelectPulse, now);
  return p ? float(*p) : 0.0f;
}

void ViewerApp::render_frame_(Clock::time_point now) {
  // Hold one snapshot for the whole frame
  const auto snap = store_.current_snapshot();
  const RenderFrame& frame = interp_.update(*snap, store_.track(), store_.epoch(), view_.followed());
  view_.update(frame);

  // keep the pulse running while a car is followed
  if (view_.mode() == ViewMode::Follow && !effects_.active(kSelectPulse, now)) {
    effects_.schedule(kSelectPulse, now, std::chrono::milliseconds{1200});
  }

  const TrackBounds bounds = view_bounds_();
  if (!store_.track()) view_.set_home(field_center(frame.cars, bounds.center()));

  BeginDrawing();
  // Grass background
  ClearBackground(Color{30, 60, 30, 255});

  if (mode_3d_) {
    rig_.update(view_, frame, bounds);
    scene_->draw(frame, rig_.pose(), labels_, pulse_(now));
  } else {
    canvas_.draw(frame, view_transform_(), labels_, pulse_(now));
  }

  canvas_.draw_minimap(frame, bounds,
                       {GetScreenWidth() - kMinimapW - 20.0, GetScreenHeight() - kMinimapH - 20.0},
                       kMinimapW, kMinimapH);

  draw_dashboard_(*snap);
  draw_race_log_();
  draw_hud_(*snap, now);
  draw_lap_banner_(*snap, now);
  if (snap->race_finished) draw_undercuts_(*snap);
  EndDrawing();
}

void ViewerApp::draw_lap_banner_(const RaceSnapshot& snap, Clock::time_point now) {
  const auto p = effects_.progress(kLapBanner, now);
  if (!p) return;
  const float alpha = 1.0f - float(*p);
  const char* text = TextFormat("LAP %d / %d", store_.leader_lap() + 1, snap.total_laps);
  const int w = MeasureText(text, 40);
  const int x = (GetScreenWidth() - w) / 2;
  DrawRectangle(x - 20, 110, w + 40, 56, Fade(Color{0,0,0,255}, 0.6f * alpha));
  DrawText(text, x, 118, 40, Fade(Color{255,215,0,255}, alpha));
}

void ViewerApp::draw_dashboard_(const RaceSnapshot& snap) {
  const auto cars = by_position(snap);

  const int row_h = 18;
  const int pad   = 8;
  const int box_w = 430;
  const int x0    = GetScreenWidth() - box_w - 20;
  const int y0    = kHUD_LINE1_Y;
  const int box_h = pad*2 + row_h*(int(cars.size()) + 1);

  // Panel
  DrawRectangle(x0 - 6, y0 - 6, box_w + 12, box_h + 12, Color{0,0,0,80});
  DrawRectangle(x0, y0, box_w, box_h, Color{24,24,28,220});
  DrawLine(x0, y0 + pad + row_h, x0 + box_w, y0 + pad + row_h, Color{60,60,70,255});

  // Column x-positions (match row draws below)
  const int X_POS  = x0 + pad + 0;
  const int X_NAME = x0 + pad + 52;
  const int X_LAP  = x0 + pad + 170;
  const int X_GAP  = x0 + pad + 214;
  const int X_TYRE = x0 + pad + 296;
  const int X_PIT  = x0 + pad + 376;

  const Color hdr = Color{220,220,230,255};
  DrawText("Pos",  X_POS,  y0 + pad - 2, 16, hdr);
  DrawText("Car",  X_NAME, y0 + pad - 2, 16, hdr);
  DrawText("Lap",  X_LAP,  y0 + pad - 2, 16, hdr);
  DrawText("Gap",  X_GAP,  y0 + pad - 2, 16, hdr);
  DrawText("Tyre", X_TYRE, y0 + pad - 2, 16, hdr);
  DrawText("Pit",  X_PIT,  y0 + pad - 2, 16, hdr);

  const Color colDefault = Color{200,200,210,255};
  const Color colGain    = Color{ 80,220,120,255};
  const Color colLoss    = Color{231, 76, 60,255};
  const auto& changes = store_.position_changes();

  int y = y0 + pad + row_h + 2;
  char buf_gap[32];
  for (const CarState* c : cars) {
    fmt_gap(c->time_interval, buf_gap, sizeof(buf_gap));
    const Color carCol = to_color(c->color);
    const bool followed = view_.mode() == ViewMode::Follow && view_.followed() == c->name;

    if (followed) DrawRectangle(x0 + 2, y - 1, box_w - 4, row_h, Color{255,215,0,40});
    DrawText(TextFormat("%2d", c->race_position), X_POS, y, 16, positionColor(c->race_position));

    auto it = changes.find(c->name);
    if (it != changes.end() && it->second != 0) {
      DrawText(TextFormat("%+d", it->second), X_POS + 24, y + 2, 12, it->second > 0 ? colGain : colLoss);
    }
    DrawRectangle(X_NAME - 14, y+2, 10, 10, carCol); // color swatch
    DrawText(c->name.c_str(), X_NAME, y, 16, carCol);
    DrawText(TextFormat("%d", c->laps_completed), X_LAP, y, 16, colDefault);
    DrawText(c->race_position == 1 ? "Leader" : buf_gap, X_GAP, y, 16, colDefault);
    DrawText(TextFormat("%s %.0f%%", c->tyre_compound.c_str(), c->tyre_wear * 100.0), X_TYRE, y, 16, colDefault);
    DrawText(c->on_pit ? "IN" : TextFormat("%d", c->pitstop_count), X_PIT, y, 16,
             c->on_pit ? Color{241,196,15,255} : colDefault);
    if (c->drs_active) DrawText("DRS", x0 + box_w - 34, y + 2, 12, colGain);

    y += row_h;
  }
}

void ViewerApp::draw_race_log_() {
  const auto& log = store_.race_log();
  const int shown = std::min<int>(int(log.size()), 8);
  if (shown == 0) return;

  const int row_h = 16;
  const int x0 = 20;
  const int box_w = 520;
  const int box_h = 28 + row_h * shown;
  const int y0 = GetScreenHeight() - box_h - 20;

  DrawRectangle(x0 - 6, y0 - 6, box_w + 12, box_h + 12, Color{0,0,0,80});
  DrawRectangle(x0, y0, box_w, box_h, Color{24,24,28,220});
  DrawText("Race Log", x0 + 8, y0 + 6, 16, Color{220,220,230,255});

  char buf_t[32];
  int y = y0 + 26;
  // newest first
  for (int i = 0; i < shown; ++i) {
    const auto& e = log[log.size() - 1 - std::size_t(i)];
    fmt_time(e.time, buf_t, sizeof(buf_t));
    DrawText(buf_t, x0 + 8, y, 14, Color{160,160,170,255});
    DrawText(TextFormat("%s  %s", e.message.c_str(), e.details.c_str()), x0 + 90, y, 14, logColor(e.kind));
    y += row_h;
  }
}

void ViewerApp::draw_undercuts_(const RaceSnapshot& snap) {
  if (snap.undercut_summary.empty()) return;

  int lines = 0;
  for (const auto& s : snap.undercut_summary) lines += 1 + int(s.undercuts.size());

  const int row_h = 16;
  const int box_w = 560;
  const int box_h = 36 + row_h * lines;
  const int x0 = (GetScreenWidth() - box_w) / 2;
  const int y0 = std::max(120, (GetScreenHeight() - box_h) / 2);

  DrawRectangle(x0 - 6, y0 - 6, box_w + 12, box_h + 12, Color{0,0,0,120});
  DrawRectangle(x0, y0, box_w, box_h, Color{24,24,28,235});
  DrawText("Undercut Summary", x0 + 10, y0 + 8, 20, Color{255,215,0,255});

  int y = y0 + 34;
  for (const auto& s : snap.undercut_summary) {
    DrawText(TextFormat("%s  lap %d  %s -> %s  pit %.2fs", s.car.c_str(), s.lap,
                        s.old_tyre.c_str(), s.new_tyre.c_str(), s.pit_time),
             x0 + 10, y, 16, Color{220,220,230,255});
    y += row_h;
    for (const auto& u : s.undercuts) {
      const Color c = u.time_gain >= 0.0 ? Color{80,220,120,255} : Color{231,76,60,255};
      DrawText(TextFormat("vs %s: %+.2fs  P%d -> P%d (%+d)", u.vs.c_str(), u.time_gain,
                          u.position_before, u.position_after, u.position_change),
               x0 + 30, y, 14, c);
      y += row_h;
    }
  }
}

void ViewerApp::draw_hud_(const RaceSnapshot& snap, Clock::time_point now) {
  // Connection indicator
  const char* conn = "Idle";
  Color conn_col = Color{200,200,210,255};
  switch (transport_.state()) {
    case TransportChannel::State::Open:
      conn = "Connected";
      conn_col = Color{80,220,120,255};
      break;
    case TransportChannel::State::Connecting:
      conn = "Connecting...";
      conn_col = Color{241,196,15,255};
      break;
    case TransportChannel::State::Backoff: {
      const double wait = std::max(0.0, std::chrono::duration<double>(transport_.next_attempt_at() - now).count());
      conn = TextFormat("Reconnecting in %.1fs (%s)", wait, transport_.last_error().c_str());
      conn_col = Color{231,76,60,255};
      break;
    }
    case TransportChannel::State::Idle:
      break;
  }
  DrawCircle(26, kHUD_LINE1_Y + 10, 6.0f, conn_col);
  DrawText(conn, 40, kHUD_LINE1_Y, 20, conn_col);

  char clock[32];
  fmt_time(snap.sim_time, clock, sizeof(clock));
  const char* status = snap.race_finished ? "Finished"
                     : snap.race_started ? "Racing"
                                         : "Not started";
  DrawText(TextFormat("%s  time=%s  lap=%d/%d  speed=%s%s%s",
                      status, clock,
                      std::min(store_.leader_lap() + 1, snap.total_laps), snap.total_laps,
                      speedLabel(control_.speed()),
                      control_.paused() ? "  [Paused]" : "",
                      store_.reset_pending() ? "  [Reset requested]" : ""),
           20, kHUD_LINE2_Y, 18, Color{220,235,220,255});

  DrawText(TextFormat("Weather: %s  rain=%.2f  track=%.0fC  wind=%.0fm/s   |   Start: %s  rain=%.1f  track=%.0fC  wind=%.0fm/s",
                      weather_label(snap.weather.rain), snap.weather.rain, snap.weather.track_temp, snap.weather.wind,
                      weather_label(start_weather_.rain), start_weather_.rain, start_weather_.track_temp, start_weather_.wind),
           20, kHUD_LINE3_Y, 14, Color{235,220,220,255});

  DrawText(TextFormat("%s | V: 2D/3D | Drag: Pan | Wheel/W/S: Zoom | Click/1..0: Follow | C: Center | L: Labels | "
                      "Enter: Start | P: Pause | [ ]: Speed | F1-F6: Weather | R: Reset",
                      mode_3d_ ? "3D" : "2D"),
           20, kHUD_LINE4_Y, 14, Color{190,205,190,255});

  if (view_.mode() == ViewMode::Follow) {
    DrawText(TextFormat("Following %s", view_.followed().c_str()),
             20, kHUD_LINE4_Y + 14 + kHUD_BOTTOM_PAD / 2, 16, Color{255,215,0,255});
  }
}

} // namespace f1live
