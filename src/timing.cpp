#include <ltbf/timing.hpp>
#include <ltbf/segment.hpp>

namespace ltbf {

std::vector<TimedDelta> lap_deltas(const Lap& lap,
                                   const AnalysisConfig& cfg,
                                   DeltaFilterStats* stats) {
  std::vector<TimedDelta> out;
  const auto& s = lap.samples;
  if (s.size() < 2) return out;
  out.reserve(s.size() - 1);

  for (std::size_t i = 1; i < s.size(); ++i) {
    const double dt = s[i].timestamp - s[i - 1].timestamp;
    if (!(dt > 0.0)) {
      if (stats) ++stats->non_positive;
      continue;
    }
    if (cfg.max_dt.has_value() && dt > *cfg.max_dt) {
      if (stats) ++stats->dropouts;
      continue;
    }
    out.push_back(TimedDelta{dt, i, segment_index(s[i].track_position, cfg.n_segments)});
  }
  return out;
}

} // namespace ltbf
