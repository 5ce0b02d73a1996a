#pragma once
#include <string>

namespace ltbf {

// Equal-width bins over [0,1]: [k/n, (k+1)/n) with the last bin closed at 1.0.
// Positions outside [0,1] are clamped first. Throws ConfigError if n_segments < 1.
int segment_index(double track_position, int n_segments);

// Display label, 1-based: 0 -> "S1".
std::string segment_label(int index);

} // namespace ltbf
