#pragma once
#include <cstddef>
#include <ostream>
#include <random>
#include <vector>
#include <ltbf/sample.hpp>

namespace ltbf {

enum class Weakness : int {
  Braking = 0,
  Exit = 1,
  LateThrottle = 2,
};

struct SynthParams {
  int laps = 30;
  int points_per_lap = 3000;
};

// What was injected into each lap (for inspection and tests).
struct SynthLapPlan {
  LapId lap = 0;
  Weakness weakness = Weakness::Braking;
  std::size_t weak_brake_corner = 0;
  std::size_t weak_exit_corner = 0;
};

struct SynthTelemetry {
  std::vector<TelemetrySample> samples;
  std::vector<SynthLapPlan> plan;
};

struct CornerZone {
  double begin;
  double end;
};

// Four corner zones in normalized track position; the third is the hairpin.
const std::vector<CornerZone>& synth_corners();

// Laps numbered from 1; timestamps accumulate across laps.
// Deterministic with caller-provided rng.
SynthTelemetry synthesize_telemetry(const SynthParams& p, std::mt19937& rng);

// Writes the required header and one row per sample, then flushes.
// Returns false if the stream failed.
bool write_telemetry_csv(std::ostream& out, const std::vector<TelemetrySample>& samples);

} // namespace ltbf
