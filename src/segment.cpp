#include <ltbf/segment.hpp>
#include <cmath>
#include <ltbf/errors.hpp>

namespace ltbf {

int segment_index(double track_position, int n_segments) {
  if (n_segments < 1) {
    throw ConfigError("n_segments", "must be >= 1, got " + std::to_string(n_segments));
  }
  if (!(track_position > 0.0)) return 0; // also catches NaN
  if (track_position >= 1.0) return n_segments - 1;

  const int idx = static_cast<int>(std::floor(track_position * n_segments));
  return idx >= n_segments ? n_segments - 1 : idx;
}

std::string segment_label(int index) {
  return "S" + std::to_string(index + 1);
}

} // namespace ltbf
