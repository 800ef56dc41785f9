#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iterator>
#include <string>
#include <vector>

#include <lapcmp/viewer/app.hpp>
#include <lapcmp/delta.hpp>
#include <lapcmp/interp.hpp>
#include <lapcmp/log.hpp>

namespace lapcmp {

namespace {

static const char* warpLabel(double w) {
  if (w == 0.25) return "0.25x";
  if (w == 0.5)  return "0.5x";
  if (w == 1.0)  return "1x";
  if (w == 2.0)  return "2x";
  if (w == 4.0)  return "4x";
  return "custom";
}

// "#RRGGBB" -> raylib color; anything else comes back gray.
static Color colorFromHex(const std::string& hex) {
  if (hex.size() != 7 || hex[0] != '#') return Color{160, 160, 160, 255};
  const unsigned long v = std::strtoul(hex.c_str() + 1, nullptr, 16);
  return Color{
    static_cast<unsigned char>((v >> 16) & 0xFF),
    static_cast<unsigned char>((v >> 8) & 0xFF),
    static_cast<unsigned char>(v & 0xFF),
    255
  };
}

static void fmt_time(double s, char* out, int cap) {
  if (cap <= 0 || out == nullptr) return;
  if (s < 0.0 || !std::isfinite(s)) { std::snprintf(out, (size_t)cap, "%s", "--"); return; }
  int minutes = (int)(s / 60.0);
  double rem  = s - minutes * 60.0;
  int secs    = (int)rem;
  int ms      = (int)((rem - secs) * 1000.0 + 0.5);
  if (minutes > 0) std::snprintf(out, (size_t)cap, "%d:%02d.%03d", minutes, secs, ms);
  else             std::snprintf(out, (size_t)cap, "%d.%03d", secs, ms);
}

static double sample_at(const std::vector<double>& v, double fidx) {
  if (v.empty()) return 0.0;
  const double clamped = std::clamp(fidx, 0.0, double(v.size() - 1));
  const std::size_t i0 = static_cast<std::size_t>(clamped);
  const std::size_t i1 = std::min(i0 + 1, v.size() - 1);
  return lerp(v[i0], v[i1], clamped - double(i0));
}

// --- Layout ---
static constexpr int kHUD_LINE1_Y    = 20;
static constexpr int kHUD_LINE2_Y    = 46;
static constexpr int kHUD_LINE3_Y    = 72;
static constexpr int kTracePanelH    = 160;
static constexpr int kTracePad       = 20;

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(const Comparison& cmp)
  : cmp_(cmp),
    elapsed1_(elapsed_time(cmp.pilot1)),
    elapsed2_(elapsed_time(cmp.pilot2)) {}

ViewerApp::Vec2f ViewerApp::worldToScreen_(double x, double y, float scale) const {
  const float cx = GetScreenWidth()  * 0.5f + pan_x_m_ * scale;
  const float cy = (GetScreenHeight() - kTracePanelH) * 0.5f - pan_y_m_ * scale;
  return { cx + float(x * scale), cy - float(y * scale) };
}

double ViewerApp::index_at_time_(const std::vector<double>& elapsed, double t) {
  if (elapsed.empty()) return 0.0;
  if (t <= elapsed.front()) return 0.0;
  if (t >= elapsed.back()) return double(elapsed.size() - 1);
  auto it = std::upper_bound(elapsed.begin(), elapsed.end(), t);
  const std::size_t i1 = static_cast<std::size_t>(std::distance(elapsed.begin(), it));
  const std::size_t i0 = i1 - 1;
  const double span = elapsed[i1] - elapsed[i0];
  const double frac = span > 0.0 ? (t - elapsed[i0]) / span : 0.0;
  return double(i0) + frac;
}

void ViewerApp::fit_to_window_() {
  const auto& xs = cmp_.circuit.x;
  const auto& ys = cmp_.circuit.y;
  pan_x_m_ = 0.0f;
  pan_y_m_ = 0.0f;
  if (xs.empty() || ys.empty()) return;
  const auto [xlo, xhi] = std::minmax_element(xs.begin(), xs.end());
  const auto [ylo, yhi] = std::minmax_element(ys.begin(), ys.end());
  const double w = std::max(1.0, *xhi - *xlo);
  const double h = std::max(1.0, *yhi - *ylo);
  const double avail_w = GetScreenWidth() * 0.85;
  const double avail_h = (GetScreenHeight() - kTracePanelH - kHUD_LINE3_Y) * 0.85;
  scale_px_per_m_ = float(std::min(avail_w / w, avail_h / h));
}

int ViewerApp::run() {
  const int W = 1280, H = 800;
  InitWindow(W, H, "lapcmp - Viewer");
  SetTargetFPS(144);
  fit_to_window_();
  LAPCMP_LOG_INFO("Viewer started: %s vs %s", cmp_.pilot1.name.c_str(), cmp_.pilot2.name.c_str());

  while (!WindowShouldClose()) {
    process_input_();
    advance_(GetFrameTime());
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  if (IsKeyPressed(KEY_SPACE)) paused_ = !paused_;
  if (IsKeyPressed(KEY_ONE))   warp_ = 0.25;
  if (IsKeyPressed(KEY_TWO))   warp_ = 0.5;
  if (IsKeyPressed(KEY_THREE)) warp_ = 1.0;
  if (IsKeyPressed(KEY_FOUR))  warp_ = 2.0;
  if (IsKeyPressed(KEY_FIVE))  warp_ = 4.0;
  if (IsKeyPressed(KEY_R))     play_time_ = 0.0;

  // Zoom
  if (IsKeyDown(KEY_W) || IsKeyDown(KEY_KP_ADD))      scale_px_per_m_ *= 1.01f;
  if (IsKeyDown(KEY_S) || IsKeyDown(KEY_KP_SUBTRACT)) scale_px_per_m_ *= 0.99f;

  // Camera pan, in screen pixels per frame while key held
  const float pan_step = 4.0f / std::max(scale_px_per_m_, 1e-3f);
  if (IsKeyDown(KEY_LEFT))  pan_x_m_ -= pan_step;
  if (IsKeyDown(KEY_RIGHT)) pan_x_m_ += pan_step;
  if (IsKeyDown(KEY_UP))    pan_y_m_ += pan_step;
  if (IsKeyDown(KEY_DOWN))  pan_y_m_ -= pan_step;
  if (IsKeyPressed(KEY_C))  fit_to_window_();
}

void ViewerApp::advance_(double frame_dt) {
  if (paused_) return;
  const double lap_end = std::max(elapsed1_.empty() ? 0.0 : elapsed1_.back(),
                                  elapsed2_.empty() ? 0.0 : elapsed2_.back());
  play_time_ += frame_dt * warp_;
  // Loop once both pilots crossed the line
  if (play_time_ > lap_end + 1.0) play_time_ = 0.0;
}

void ViewerApp::render_frame_() {
  BeginDrawing();
  ClearBackground(Color{18, 18, 22, 255});

  draw_circuit_(scale_px_per_m_);
  draw_pilots_(scale_px_per_m_);
  draw_delta_trace_();
  draw_hud_();

  EndDrawing();
}

void ViewerApp::draw_circuit_(float scale_px_per_m) {
  const auto& xs = cmp_.circuit.x;
  const auto& ys = cmp_.circuit.y;
  const auto& cols = cmp_.circuit.colors;
  const std::size_t n = std::min(xs.size(), ys.size());
  if (n < 2) return;

  // Dark underlay, then one colored segment per point pair
  for (std::size_t i = 1; i < n; ++i) {
    auto a = worldToScreen_(xs[i-1], ys[i-1], scale_px_per_m);
    auto b = worldToScreen_(xs[i],   ys[i],   scale_px_per_m);
    DrawLineEx({a.x, a.y}, {b.x, b.y}, 10.0f, Color{40, 40, 46, 255});
  }
  for (std::size_t i = 1; i < n; ++i) {
    auto a = worldToScreen_(xs[i-1], ys[i-1], scale_px_per_m);
    auto b = worldToScreen_(xs[i],   ys[i],   scale_px_per_m);
    const Color c = (i - 1 < cols.size()) ? colorFromHex(cols[i-1]) : Color{160, 160, 160, 255};
    DrawLineEx({a.x, a.y}, {b.x, b.y}, 5.0f, c);
  }

  // Start/finish marker
  auto s = worldToScreen_(xs[0], ys[0], scale_px_per_m);
  DrawCircleV({s.x, s.y}, 6.0f, Color{240, 240, 240, 255});
}

void ViewerApp::draw_pilots_(float scale_px_per_m) {
  const auto& xs = cmp_.circuit.x;
  const auto& ys = cmp_.circuit.y;
  if (xs.empty()) return;

  auto draw_one = [&](const SynchronizedTelemetry& p, const std::vector<double>& elapsed) {
    const double fi = index_at_time_(elapsed, play_time_);
    auto pos = worldToScreen_(sample_at(xs, fi), sample_at(ys, fi), scale_px_per_m);
    const Color c = colorFromHex(p.color);
    DrawCircleV({pos.x, pos.y}, 8.0f, Color{0, 0, 0, 160});
    DrawCircleV({pos.x, pos.y}, 6.0f, c);
    DrawText(p.name.c_str(), int(pos.x) + 10, int(pos.y) - 8, 16, c);
  };
  draw_one(cmp_.pilot2, elapsed2_);
  draw_one(cmp_.pilot1, elapsed1_);
}

void ViewerApp::draw_delta_trace_() {
  const auto& d = cmp_.delta;
  const auto& dist = cmp_.pilot1.distance;
  const std::size_t n = std::min(d.size(), dist.size());
  const int x0 = kTracePad;
  const int y0 = GetScreenHeight() - kTracePanelH;
  const int w  = GetScreenWidth() - 2 * kTracePad;
  const int h  = kTracePanelH - kTracePad;

  DrawRectangle(x0, y0, w, h, Color{24, 24, 28, 220});
  if (n < 2 || dist.back() <= 0.0) return;

  const auto [lo, hi] = std::minmax_element(d.begin(), d.begin() + static_cast<std::ptrdiff_t>(n));
  const double span = std::max(1e-3, std::max(std::fabs(*lo), std::fabs(*hi)));
  auto to_px = [&](double distance_m, double delta_s) {
    const float px = x0 + float(distance_m / dist.back()) * float(w);
    const float py = y0 + h * 0.5f - float(delta_s / span) * (h * 0.45f);
    return Vector2{px, py};
  };

  // Zero line
  DrawLine(x0, y0 + h / 2, x0 + w, y0 + h / 2, Color{70, 70, 80, 255});
  for (std::size_t i = 1; i < n; ++i) {
    DrawLineEx(to_px(dist[i-1], d[i-1]), to_px(dist[i], d[i]), 2.0f, Color{230, 230, 240, 255});
  }

  // Playback cursor (pilot 1 position)
  const double fi = index_at_time_(elapsed1_, play_time_);
  const Vector2 cur = to_px(sample_at(dist, fi), sample_at(d, fi));
  DrawLine(int(cur.x), y0, int(cur.x), y0 + h, Color{255, 215, 0, 160});

  DrawText(TextFormat("delta %s vs %s  (+ = %s behind)  range +/-%.3fs",
                      cmp_.pilot1.name.c_str(), cmp_.pilot2.name.c_str(),
                      cmp_.pilot1.name.c_str(), span),
           x0 + 8, y0 + 6, 14, Color{190, 190, 200, 255});
}

void ViewerApp::draw_hud_() {
  const double fi1 = index_at_time_(elapsed1_, play_time_);
  const double fi2 = index_at_time_(elapsed2_, play_time_);
  const double v1 = sample_at(cmp_.pilot1.speed, fi1);
  const double v2 = sample_at(cmp_.pilot2.speed, fi2);
  const double delta_now = sample_at(cmp_.delta, fi1);

  char t_buf[32];
  fmt_time(play_time_, t_buf, sizeof(t_buf));

  DrawText(TextFormat("%s (lap %d) vs %s (lap %d)  rotation=%d deg  t=%s  warp=%s%s",
                      cmp_.pilot1.name.c_str(), cmp_.pilot1.lap,
                      cmp_.pilot2.name.c_str(), cmp_.pilot2.lap,
                      cmp_.metadata.rotation_deg, t_buf, warpLabel(warp_),
                      paused_ ? "  [paused]" : ""),
           20, kHUD_LINE1_Y, 20, Color{220, 235, 220, 255});

  DrawText(TextFormat("%s %.0f km/h", cmp_.pilot1.name.c_str(), v1),
           20, kHUD_LINE2_Y, 18, colorFromHex(cmp_.pilot1.color));
  DrawText(TextFormat("%s %.0f km/h", cmp_.pilot2.name.c_str(), v2),
           220, kHUD_LINE2_Y, 18, colorFromHex(cmp_.pilot2.color));
  DrawText(TextFormat("delta %+.3f s", delta_now), 420, kHUD_LINE2_Y, 18, Color{235, 220, 220, 255});

  DrawText("Space: Pause/Resume | 1..5: 0.25x 0.5x 1x 2x 4x | W/S or +/-: Zoom | Arrows: Pan | C: Fit | R: Restart",
           20, kHUD_LINE3_Y, 14, Color{190, 205, 190, 255});
}

} // namespace lapcmp
