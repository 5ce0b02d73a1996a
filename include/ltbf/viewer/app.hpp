#pragma once
#include <string>
#include <ltbf/chart_model.hpp>
#include <ltbf/config.hpp>

namespace ltbf {

// RAII application that renders the ranked table and loss bar chart.
class ViewerApp {
public:
  ViewerApp(std::string csv_path, const AnalysisConfig& cfg);
  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  void process_input_();
  void reanalyse_();
  // Rendering
  void render_frame_();
  void draw_header_();
  void draw_table_(int x, int y, int w);
  void draw_chart_(int x, int y, int w, int h);

  std::string path_;
  AnalysisConfig cfg_;
  ChartModel chart_;
  std::string status_;  // last load/analysis problem, empty when fine
};

} // namespace ltbf
