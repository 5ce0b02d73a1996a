#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>
#include <spdlog/spdlog.h>

#include <ltbf/viewer/app.hpp>
#include <ltbf/analyzer.hpp>
#include <ltbf/segment.hpp>

namespace ltbf {

namespace {

static constexpr int kMaxSegments = 32;
static constexpr double kThresholdStep = 0.05;

// Series colors: overall, brake, exit
static const Color kSeries[3] = {
  {52, 152, 219, 255},  // blue
  {231, 76, 60, 255},   // red
  {46, 204, 113, 255},  // green
};

static double clamp01(double x) {
  return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
}

static double round_step(double x) {
  return std::round(x / kThresholdStep) * kThresholdStep;
}

} // namespace

ViewerApp::ViewerApp(std::string csv_path, const AnalysisConfig& cfg)
  : path_(std::move(csv_path)), cfg_(cfg) {}

int ViewerApp::run() {
  const int W = 1100, H = 760;
  InitWindow(W, H, "LTBF - Bottleneck Viewer");
  SetTargetFPS(60);

  reanalyse_();
  while (!WindowShouldClose()) {
    process_input_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  bool changed = false;
  if (IsKeyPressed(KEY_UP) && cfg_.n_segments < kMaxSegments) { ++cfg_.n_segments; changed = true; }
  if (IsKeyPressed(KEY_DOWN) && cfg_.n_segments > 1)          { --cfg_.n_segments; changed = true; }

  // Thresholds: B/T raise, with shift lower
  const bool shift = IsKeyDown(KEY_LEFT_SHIFT) || IsKeyDown(KEY_RIGHT_SHIFT);
  const double step = shift ? -kThresholdStep : kThresholdStep;
  if (IsKeyPressed(KEY_B)) { cfg_.brake_threshold = clamp01(round_step(cfg_.brake_threshold + step)); changed = true; }
  if (IsKeyPressed(KEY_T)) { cfg_.throttle_threshold = clamp01(round_step(cfg_.throttle_threshold + step)); changed = true; }

  if (IsKeyPressed(KEY_R)) changed = true;
  if (changed) reanalyse_();
}

void ViewerApp::reanalyse_() {
  status_.clear();
  try {
    auto report = analyze_csv_file(path_, cfg_);
    if (!report) {
      status_ = "Cannot open " + path_;
      spdlog::error("{}", status_);
      chart_.clear();
      return;
    }
    if (!report->warnings.empty()) {
      status_ = std::to_string(report->warnings.size()) + " row(s) dropped";
    }
    chart_.replace(std::move(*report), cfg_);
  } catch (const SchemaError& e) {
    status_ = e.what();
    spdlog::error("{}", status_);
    chart_.clear();
  } catch (const ConfigError& e) {
    status_ = e.what();
    spdlog::error("{}", status_);
    chart_.clear();
  }
}

void ViewerApp::render_frame_() {
  BeginDrawing();
  ClearBackground(Color{24, 26, 30, 255});

  draw_header_();
  const int W = GetScreenWidth();
  const int H = GetScreenHeight();
  draw_table_(20, 80, W - 40);
  draw_chart_(60, H / 2 + 10, W - 100, H / 2 - 60);

  EndDrawing();
}

void ViewerApp::draw_header_() {
  char line[256];
  std::snprintf(line, sizeof(line), "%s", path_.c_str());
  DrawText(line, 20, 16, 20, RAYWHITE);

  std::snprintf(line, sizeof(line),
                "Segments %d [Up/Down]   Brake thr %.2f [B]   Throttle thr %.2f [T]   Reload [R]",
                cfg_.n_segments, cfg_.brake_threshold, cfg_.throttle_threshold);
  DrawText(line, 20, 42, 16, LIGHTGRAY);

  if (!status_.empty()) {
    DrawText(status_.c_str(), 20, 62, 14, Color{241, 196, 15, 255});
  }
}

void ViewerApp::draw_table_(int x, int y, int w) {
  const auto& rows = chart_.report().segments;
  if (rows.empty()) {
    DrawText("No results. Load a CSV with at least 2 laps.", x, y + 8, 18, LIGHTGRAY);
    return;
  }

  static const char* kHead[] = {"Seg", "Avg (s)", "Best (s)", "Loss (s)", "Brake", "Exit", "Late thr", "Top cause"};
  const int cols = 8;
  const int col_w = w / (cols + 1);
  for (int c = 0; c < cols; ++c) {
    DrawText(kHead[c], x + c * col_w, y, 16, GRAY);
  }

  // Rows that fit above the chart
  const int row_h = 20;
  const int max_rows = std::max(1, (GetScreenHeight() / 2 - y - 30) / row_h);
  char cell[64];
  for (int i = 0; i < static_cast<int>(rows.size()) && i < max_rows; ++i) {
    const auto& r = rows[static_cast<std::size_t>(i)];
    const int ry = y + (i + 1) * row_h + 4;
    const Color fg = (i == 0) ? RAYWHITE : LIGHTGRAY; // worst segment stands out
    const double vals[6] = {r.avg_dt, r.best_dt, r.loss, r.brake_time_loss,
                            r.exit_time_loss, r.exit_throttle_delay_loss};
    DrawText(segment_label(r.segment).c_str(), x, ry, 16, fg);
    for (int c = 0; c < 6; ++c) {
      std::snprintf(cell, sizeof(cell), "%.3f", vals[c]);
      DrawText(cell, x + (c + 1) * col_w, ry, 16, fg);
    }
    DrawText(cause_label(r.top_cause), x + 7 * col_w, ry, 16, fg);
  }
}

void ViewerApp::draw_chart_(int x, int y, int w, int h) {
  DrawRectangleLines(x, y, w, h, DARKGRAY);
  const auto& bars = chart_.bars();
  if (bars.empty()) return;

  const double lo = chart_.y_min();
  const double hi = chart_.y_max();
  const double span = (hi - lo) > 0.0 ? (hi - lo) : 1.0;
  auto to_y = [&](double v){ return y + h - static_cast<int>((v - lo) / span * h); };

  // Zero line and axis labels
  const int zero_y = to_y(0.0);
  DrawLine(x, zero_y, x + w, zero_y, GRAY);
  char lab[32];
  std::snprintf(lab, sizeof(lab), "%.3g s", hi);
  DrawText(lab, x - 50, y - 6, 12, GRAY);
  std::snprintf(lab, sizeof(lab), "%.3g s", lo);
  DrawText(lab, x - 50, y + h - 6, 12, GRAY);

  const int group_w = w / static_cast<int>(bars.size());
  const int bar_w = std::max(2, group_w / 4);
  for (std::size_t i = 0; i < bars.size(); ++i) {
    const auto& b = bars[i];
    const double vals[3] = {b.overall, b.brake, b.exit};
    const int gx = x + static_cast<int>(i) * group_w + group_w / 8;
    for (int k = 0; k < 3; ++k) {
      const int vy = to_y(vals[k]);
      const int top = std::min(vy, zero_y);
      const int height = std::max(1, std::abs(zero_y - vy));
      DrawRectangle(gx + k * bar_w, top, bar_w - 1, height, kSeries[k]);
    }
    DrawText(b.label.c_str(), gx, y + h + 6, 14, LIGHTGRAY);
  }

  // Legend
  static const char* kLegend[3] = {"Overall loss", "Brake loss", "Exit loss"};
  for (int k = 0; k < 3; ++k) {
    DrawRectangle(x + 10 + k * 130, y + 8, 12, 12, kSeries[k]);
    DrawText(kLegend[k], x + 28 + k * 130, y + 7, 14, LIGHTGRAY);
  }
}

} // namespace ltbf
