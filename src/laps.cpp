#include <ltbf/laps.hpp>
#include <algorithm>
#include <map>
#include <utility>
#include <spdlog/spdlog.h>

namespace ltbf {

std::vector<Lap> partition_laps(const std::vector<TelemetrySample>& samples) {
  std::map<LapId, std::vector<TelemetrySample>> by_lap;
  for (const auto& s : samples) by_lap[s.lap].push_back(s);

  std::vector<Lap> out;
  out.reserve(by_lap.size());
  for (auto& [id, group] : by_lap) {
    if (group.size() < 2) {
      spdlog::warn("dropping lap {}: {} sample(s), need at least 2", id, group.size());
      continue;
    }
    std::stable_sort(group.begin(), group.end(),
                     [](const TelemetrySample& a, const TelemetrySample& b){
                       return a.timestamp < b.timestamp;
                     });
    out.push_back(Lap{id, std::move(group)});
  }
  return out;
}

} // namespace ltbf
