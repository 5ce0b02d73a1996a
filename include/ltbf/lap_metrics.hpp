#pragma once
#include <cstddef>
#include <vector>
#include <ltbf/config.hpp>
#include <ltbf/laps.hpp>
#include <ltbf/timing.hpp>

namespace ltbf {

// Timing and driver-input heuristics for one (lap, segment) pair.
// Channel averages and phase times use the later sample of each retained pair.
struct SegmentLapRecord {
  LapId lap = 0;
  int segment = 0;

  double dt_sum = 0.0;
  double avg_speed = 0.0;
  double avg_throttle = 0.0;
  double avg_brake = 0.0;

  double brake_time = 0.0;         // brake >= brake_threshold
  double exit_time = 0.0;          // first throttle-on sample -> segment end
  double late_throttle_time = 0.0; // apex (min speed) -> throttle re-applied
  double entry_time = 0.0;         // segment start -> apex, inclusive
  double throttle_time = 0.0;      // throttle >= throttle_threshold
  double coast_time = 0.0;         // neither pedal over its threshold
};

// One record per segment that retained at least one delta, ascending segment.
std::vector<SegmentLapRecord> segment_lap_records(const Lap& lap,
                                                  const std::vector<TimedDelta>& deltas,
                                                  const AnalysisConfig& cfg);

} // namespace ltbf
