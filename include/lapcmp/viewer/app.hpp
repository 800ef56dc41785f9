#pragma once
#include <cstddef>
#include <vector>
#include <lapcmp/compare.hpp>

namespace lapcmp {

// RAII application that replays a two-driver comparison: microsector-colored
// circuit, one marker per pilot on the shared trajectory, delta trace and HUD.
class ViewerApp {
public:
  explicit ViewerApp(const Comparison& cmp);
  int run(); // returns 0 on normal exit

private:
  // Input & playback
  void process_input_();
  void advance_(double frame_dt);
  // Rendering
  void render_frame_();
  void draw_circuit_(float scale_px_per_m);
  void draw_pilots_(float scale_px_per_m);
  void draw_delta_trace_();
  void draw_hud_();

  // Helpers
  struct Vec2f { float x; float y; };
  Vec2f worldToScreen_(double x, double y, float scale) const;
  // Checkpoint position (fractional index) reached after elapsed seconds.
  static double index_at_time_(const std::vector<double>& elapsed, double t);
  void fit_to_window_();

  const Comparison& cmp_;
  std::vector<double> elapsed1_;
  std::vector<double> elapsed2_;

  // Playback state
  double play_time_{0.0};
  double warp_{1.0};
  bool paused_{false};

  // UI state
  float scale_px_per_m_{0.15f};
  float pan_x_m_{0.0f};
  float pan_y_m_{0.0f};
};

} // namespace lapcmp
