#include <ltbf/attribution.hpp>
#include <algorithm>
#include <cmath>

namespace ltbf {

const char* cause_label(Cause c) {
  switch (c) {
    case Cause::Braking:      return "braking";
    case Cause::CornerExit:   return "corner_exit";
    case Cause::LateThrottle: return "corner_exit (late throttle)";
  }
  return "unknown";
}

Cause top_cause(double brake_time_loss, double exit_time_loss, double exit_throttle_delay_loss) {
  const double b = std::fabs(brake_time_loss);
  const double e = std::fabs(exit_time_loss);
  const double l = std::fabs(exit_throttle_delay_loss);
  // Strict comparisons keep the earlier cause on ties.
  Cause best = Cause::Braking;
  double top = b;
  if (e > top) { best = Cause::CornerExit; top = e; }
  if (l > top) { best = Cause::LateThrottle; }
  return best;
}

SegmentSummary attribute_loss(const SegmentAggregate& agg) {
  SegmentSummary s;
  s.segment = agg.segment;
  s.laps = agg.laps;
  s.best_lap = agg.best.lap;
  s.avg_dt = agg.avg_dt;
  s.best_dt = agg.best_dt;
  s.loss = std::max(0.0, agg.avg_dt - agg.best_dt);
  if (agg.avg_dt != 0.0) s.loss_percent = 100.0 * s.loss / agg.avg_dt;

  s.brake_time_loss = agg.mean_brake_time - agg.best.brake_time;
  s.exit_time_loss = agg.mean_exit_time - agg.best.exit_time;
  s.exit_throttle_delay_loss = agg.mean_late_throttle_time - agg.best.late_throttle_time;
  s.entry_time_loss = agg.mean_entry_time - agg.best.entry_time;
  s.throttle_time_loss = agg.mean_throttle_time - agg.best.throttle_time;
  s.coast_time_loss = agg.mean_coast_time - agg.best.coast_time;
  s.top_cause = top_cause(s.brake_time_loss, s.exit_time_loss, s.exit_throttle_delay_loss);

  s.avg_speed = agg.avg_speed;
  s.avg_throttle = agg.avg_throttle;
  s.avg_brake = agg.avg_brake;
  return s;
}

void rank_segments(std::vector<SegmentSummary>& rows) {
  std::stable_sort(rows.begin(), rows.end(), [](const SegmentSummary& a, const SegmentSummary& b){
    if (a.loss != b.loss) return a.loss > b.loss;
    return a.segment < b.segment;
  });
}

} // namespace ltbf
