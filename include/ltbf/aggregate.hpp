#pragma once
#include <cstddef>
#include <vector>
#include <ltbf/lap_metrics.hpp>

namespace ltbf {

// Cross-lap view of one segment.
struct SegmentAggregate {
  int segment = 0;
  std::size_t laps = 0;     // laps with data in this segment

  double avg_dt = 0.0;      // mean dt_sum
  double best_dt = 0.0;     // min dt_sum
  SegmentLapRecord best;    // record of the best lap (lowest id on ties)

  double mean_brake_time = 0.0;
  double mean_exit_time = 0.0;
  double mean_late_throttle_time = 0.0;
  double mean_entry_time = 0.0;
  double mean_throttle_time = 0.0;
  double mean_coast_time = 0.0;

  double avg_speed = 0.0;
  double avg_throttle = 0.0;
  double avg_brake = 0.0;
};

// One aggregate per segment present in at least one record, ascending segment.
std::vector<SegmentAggregate> aggregate_segments(const std::vector<SegmentLapRecord>& records);

} // namespace ltbf
