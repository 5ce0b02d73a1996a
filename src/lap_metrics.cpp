#include <ltbf/lap_metrics.hpp>
#include <map>

namespace ltbf {

namespace {

struct Pair {
  double dt;
  const TelemetrySample* s; // later sample
};

SegmentLapRecord summarize_group(LapId lap, int segment,
                                 const std::vector<Pair>& g,
                                 const AnalysisConfig& cfg) {
  SegmentLapRecord r;
  r.lap = lap;
  r.segment = segment;

  const double thr_on = cfg.throttle_threshold;
  const double brk_on = cfg.brake_threshold;

  std::size_t apex = 0;
  for (std::size_t i = 0; i < g.size(); ++i) {
    const auto& s = *g[i].s;
    const double dt = g[i].dt;
    r.dt_sum += dt;
    r.avg_speed += s.speed;
    r.avg_throttle += s.throttle;
    r.avg_brake += s.brake;

    const bool braking = s.brake >= brk_on;
    const bool throttle = s.throttle >= thr_on;
    if (braking) r.brake_time += dt;
    if (throttle) r.throttle_time += dt;
    if (!braking && !throttle) r.coast_time += dt;

    if (s.speed < g[apex].s->speed) apex = i; // first minimum wins
  }
  const double n = static_cast<double>(g.size());
  r.avg_speed /= n;
  r.avg_throttle /= n;
  r.avg_brake /= n;

  for (std::size_t i = 0; i <= apex; ++i) r.entry_time += g[i].dt;

  // Powered exit: from the first throttle-on sample to the end of the group.
  for (std::size_t i = 0; i < g.size(); ++i) {
    if (g[i].s->throttle >= thr_on) {
      for (std::size_t k = i; k < g.size(); ++k) r.exit_time += g[k].dt;
      break;
    }
  }

  // Late throttle: after the apex up to and including the re-application.
  // Stays zero if throttle never comes back within the segment.
  double pending = 0.0;
  for (std::size_t i = apex + 1; i < g.size(); ++i) {
    pending += g[i].dt;
    if (g[i].s->throttle >= thr_on) {
      r.late_throttle_time = pending;
      break;
    }
  }
  return r;
}

} // namespace

std::vector<SegmentLapRecord> segment_lap_records(const Lap& lap,
                                                  const std::vector<TimedDelta>& deltas,
                                                  const AnalysisConfig& cfg) {
  std::map<int, std::vector<Pair>> groups;
  for (const auto& d : deltas) {
    groups[d.segment].push_back(Pair{d.dt, &lap.samples[d.sample]});
  }

  std::vector<SegmentLapRecord> out;
  out.reserve(groups.size());
  for (const auto& [seg, g] : groups) {
    out.push_back(summarize_group(lap.id, seg, g, cfg));
  }
  return out;
}

} // namespace ltbf
