#pragma once
#include <array>
#include <cstdint>
#include <string>

namespace ltbf {

using LapId = std::int64_t;

// One parsed telemetry row. Immutable after validation.
struct TelemetrySample {
  double timestamp = 0.0;      // seconds (monotonic within a lap)
  LapId  lap = 0;
  double speed = 0.0;
  double throttle = 0.0;       // nominally 0..1
  double brake = 0.0;          // nominally 0..1
  double steering = 0.0;
  double track_position = 0.0; // clamped to 0..1
};

// Column names every input must carry (case-sensitive).
inline const std::array<std::string, 7>& required_columns() {
  static const std::array<std::string, 7> cols{
    "timestamp", "lap", "speed", "throttle", "brake", "steering", "track_position"
  };
  return cols;
}

} // namespace ltbf
