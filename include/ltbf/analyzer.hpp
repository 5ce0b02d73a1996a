#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <ltbf/attribution.hpp>
#include <ltbf/config.hpp>
#include <ltbf/csv.hpp>
#include <ltbf/errors.hpp>
#include <ltbf/timing.hpp>

namespace ltbf {

struct AnalysisReport {
  std::vector<SegmentSummary> segments;  // ranked, may be empty ("no results")
  std::vector<RowParseWarning> warnings; // dropped input rows
  std::size_t samples = 0;               // valid samples
  std::size_t laps_used = 0;             // laps with >= 2 samples
  DeltaFilterStats filtered;

  bool empty() const { return segments.empty(); }
};

// Full pipeline over already-parsed samples. Config is validated first
// (ConfigError). Fewer than 2 usable laps yields an empty report.
AnalysisReport analyze_samples(const std::vector<TelemetrySample>& samples,
                               const AnalysisConfig& cfg);

// Config check, schema check (SchemaError), row parsing, then analyze_samples.
AnalysisReport analyze_table(const CsvTable& table, const AnalysisConfig& cfg);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<AnalysisReport> analyze_csv_file(const std::string& path,
                                               const AnalysisConfig& cfg);

} // namespace ltbf
