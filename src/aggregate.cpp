#include <ltbf/aggregate.hpp>
#include <map>

namespace ltbf {

static bool better_than(const SegmentLapRecord& a, const SegmentLapRecord& b) {
  if (a.dt_sum != b.dt_sum) return a.dt_sum < b.dt_sum;
  return a.lap < b.lap;
}

std::vector<SegmentAggregate> aggregate_segments(const std::vector<SegmentLapRecord>& records) {
  std::map<int, std::vector<const SegmentLapRecord*>> by_segment;
  for (const auto& r : records) by_segment[r.segment].push_back(&r);

  std::vector<SegmentAggregate> out;
  out.reserve(by_segment.size());
  for (const auto& [seg, group] : by_segment) {
    SegmentAggregate a;
    a.segment = seg;
    a.laps = group.size();

    const SegmentLapRecord* best = group.front();
    for (const auto* r : group) {
      a.avg_dt += r->dt_sum;
      a.mean_brake_time += r->brake_time;
      a.mean_exit_time += r->exit_time;
      a.mean_late_throttle_time += r->late_throttle_time;
      a.mean_entry_time += r->entry_time;
      a.mean_throttle_time += r->throttle_time;
      a.mean_coast_time += r->coast_time;
      a.avg_speed += r->avg_speed;
      a.avg_throttle += r->avg_throttle;
      a.avg_brake += r->avg_brake;
      if (better_than(*r, *best)) best = r;
    }

    const double n = static_cast<double>(group.size());
    a.avg_dt /= n;
    a.mean_brake_time /= n;
    a.mean_exit_time /= n;
    a.mean_late_throttle_time /= n;
    a.mean_entry_time /= n;
    a.mean_throttle_time /= n;
    a.mean_coast_time /= n;
    a.avg_speed /= n;
    a.avg_throttle /= n;
    a.avg_brake /= n;

    a.best = *best;
    a.best_dt = best->dt_sum;
    if (a.avg_dt < a.best_dt) a.avg_dt = a.best_dt; // rounding on identical laps
    out.push_back(a);
  }
  return out;
}

} // namespace ltbf
