#pragma once
#include <vector>
#include <ltbf/sample.hpp>

namespace ltbf {

struct Lap {
  LapId id = 0;
  std::vector<TelemetrySample> samples; // ascending timestamp
};

// Groups by lap id (ascending), stable-sorts each lap by timestamp and drops
// laps with fewer than 2 samples.
std::vector<Lap> partition_laps(const std::vector<TelemetrySample>& samples);

} // namespace ltbf
