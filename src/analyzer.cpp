#include <ltbf/analyzer.hpp>
#include <spdlog/spdlog.h>
#include <ltbf/aggregate.hpp>
#include <ltbf/lap_metrics.hpp>
#include <ltbf/laps.hpp>
#include <ltbf/validator.hpp>

namespace ltbf {

static AnalysisReport run_pipeline(const std::vector<TelemetrySample>& samples,
                                   const AnalysisConfig& cfg) {
  AnalysisReport report;
  report.samples = samples.size();

  const auto laps = partition_laps(samples);
  report.laps_used = laps.size();
  if (laps.size() < 2) {
    spdlog::info("{} usable lap(s); need at least 2 to compare", laps.size());
    return report;
  }

  std::vector<SegmentLapRecord> records;
  for (const auto& lap : laps) {
    const auto deltas = lap_deltas(lap, cfg, &report.filtered);
    auto recs = segment_lap_records(lap, deltas, cfg);
    spdlog::debug("lap {}: {} samples, {} deltas, {} segments",
                  lap.id, lap.samples.size(), deltas.size(), recs.size());
    records.insert(records.end(), recs.begin(), recs.end());
  }

  if (report.filtered.non_positive > 0) {
    spdlog::debug("discarded {} non-positive dt values", report.filtered.non_positive);
  }
  if (report.filtered.dropouts > 0) {
    spdlog::warn("discarded {} dt values above max_dt={}",
                 report.filtered.dropouts, cfg.max_dt.value_or(0.0));
  }

  for (const auto& agg : aggregate_segments(records)) {
    report.segments.push_back(attribute_loss(agg));
  }
  rank_segments(report.segments);

  spdlog::info("analysed {} laps over {} segments: {} with data",
               report.laps_used, cfg.n_segments, report.segments.size());
  return report;
}

AnalysisReport analyze_samples(const std::vector<TelemetrySample>& samples,
                               const AnalysisConfig& cfg) {
  validate_config(cfg);
  return run_pipeline(samples, cfg);
}

AnalysisReport analyze_table(const CsvTable& table, const AnalysisConfig& cfg) {
  validate_config(cfg);
  auto parsed = validate_samples(table);
  auto report = run_pipeline(parsed.samples, cfg);
  report.warnings = std::move(parsed.warnings);
  return report;
}

std::optional<AnalysisReport> analyze_csv_file(const std::string& path,
                                               const AnalysisConfig& cfg) {
  validate_config(cfg);
  auto table = load_csv(path);
  if (!table) return std::nullopt;
  return analyze_table(*table, cfg);
}

} // namespace ltbf
