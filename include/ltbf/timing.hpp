#pragma once
#include <cstddef>
#include <vector>
#include <ltbf/config.hpp>
#include <ltbf/laps.hpp>

namespace ltbf {

// A retained inter-sample delta. `sample` indexes the later sample of the
// pair in Lap::samples; the delta is attributed to that sample's segment.
struct TimedDelta {
  double dt = 0.0;
  std::size_t sample = 0;
  int segment = 0;
};

struct DeltaFilterStats {
  std::size_t non_positive = 0; // dt <= 0 (duplicate / out-of-order clock)
  std::size_t dropouts = 0;     // dt > max_dt
};

// dt[i] = t[i] - t[i-1] for i >= 1, dropping dt <= 0 and, when configured,
// dt > max_dt. No interpolation across segment boundaries.
std::vector<TimedDelta> lap_deltas(const Lap& lap,
                                   const AnalysisConfig& cfg,
                                   DeltaFilterStats* stats = nullptr);

} // namespace ltbf
