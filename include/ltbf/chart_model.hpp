#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <ltbf/analyzer.hpp>
#include <ltbf/config.hpp>

namespace ltbf {

// The result currently on screen. Owns exactly one analysis at a time:
// replace() discards the previous one and rebuilds the bar series.
class ChartModel {
public:
  struct Bar {
    std::string label;  // "S1".. in ranked order
    double overall = 0.0;
    double brake = 0.0;
    double exit = 0.0;
  };

  void replace(AnalysisReport report, const AnalysisConfig& cfg);
  void clear();

  bool empty() const { return report_.segments.empty(); }
  const AnalysisReport& report() const { return report_; }
  const AnalysisConfig& config() const { return cfg_; }
  const std::vector<Bar>& bars() const { return bars_; }

  // Axis range covering every bar value; always includes zero.
  double y_min() const { return y_min_; }
  double y_max() const { return y_max_; }

  // Bumped on every replace()/clear(); lets renderers detect a new result.
  std::uint64_t generation() const { return generation_; }

private:
  AnalysisReport report_{};
  AnalysisConfig cfg_{};
  std::vector<Bar> bars_;
  double y_min_{0.0};
  double y_max_{1.0};
  std::uint64_t generation_{0};
};

// Smallest 1/2/5 x 10^k value >= v (v > 0); 1.0 for v <= 0.
double nice_ceil(double v);

} // namespace ltbf
