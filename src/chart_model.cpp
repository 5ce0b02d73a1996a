#include <ltbf/chart_model.hpp>
#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <utility>
#include <ltbf/segment.hpp>

namespace ltbf {

double nice_ceil(double v) {
  if (!(v > 0.0) || !std::isfinite(v)) return 1.0;
  const double mag = std::pow(10.0, std::floor(std::log10(v)));
  for (double step : {1.0, 2.0, 5.0, 10.0}) {
    if (step * mag >= v) return step * mag;
  }
  return 10.0 * mag;
}

void ChartModel::replace(AnalysisReport report, const AnalysisConfig& cfg) {
  report_ = std::move(report);
  cfg_ = cfg;
  bars_.clear();
  bars_.reserve(report_.segments.size());

  double lo = 0.0, hi = 0.0;
  for (const auto& s : report_.segments) {
    Bar b{segment_label(s.segment), s.loss, s.brake_time_loss, s.exit_time_loss};
    lo = std::min({lo, b.overall, b.brake, b.exit});
    hi = std::max({hi, b.overall, b.brake, b.exit});
    bars_.push_back(std::move(b));
  }
  y_max_ = nice_ceil(hi);
  y_min_ = lo < 0.0 ? -nice_ceil(-lo) : 0.0;
  ++generation_;
}

void ChartModel::clear() {
  report_ = AnalysisReport{};
  bars_.clear();
  y_min_ = 0.0;
  y_max_ = 1.0;
  ++generation_;
}

} // namespace ltbf
