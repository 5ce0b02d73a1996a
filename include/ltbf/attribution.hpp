#pragma once
#include <cstddef>
#include <optional>
#include <vector>
#include <ltbf/aggregate.hpp>
#include <ltbf/sample.hpp>

namespace ltbf {

enum class Cause : int {
  Braking = 0,
  CornerExit = 1,
  LateThrottle = 2,
};

// "braking", "corner_exit", "corner_exit (late throttle)"
const char* cause_label(Cause c);

// Final output row for one segment.
struct SegmentSummary {
  int segment = 0;
  std::size_t laps = 0;
  LapId best_lap = 0;

  double avg_dt = 0.0;
  double best_dt = 0.0;
  double loss = 0.0;                   // avg_dt - best_dt, serialized as time_loss and loss
  std::optional<double> loss_percent;  // empty when avg_dt == 0

  // Independent heuristics: mean over laps minus the best lap's value.
  // Not a partition of `loss`; may be negative.
  double brake_time_loss = 0.0;
  double exit_time_loss = 0.0;
  double exit_throttle_delay_loss = 0.0;
  double entry_time_loss = 0.0;        // informational, not ranked
  double throttle_time_loss = 0.0;     // informational, not ranked
  double coast_time_loss = 0.0;        // informational, not ranked

  Cause top_cause = Cause::Braking;

  double avg_speed = 0.0;
  double avg_throttle = 0.0;
  double avg_brake = 0.0;
};

// Largest |value| wins; exact ties prefer braking, then exit, then late throttle.
Cause top_cause(double brake_time_loss, double exit_time_loss, double exit_throttle_delay_loss);

SegmentSummary attribute_loss(const SegmentAggregate& agg);

// Descending loss; equal losses keep ascending segment index.
void rank_segments(std::vector<SegmentSummary>& rows);

} // namespace ltbf
