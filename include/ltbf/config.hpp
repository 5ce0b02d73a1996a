#pragma once
#include <istream>
#include <optional>
#include <string>

namespace ltbf {

// Analysis parameters. Validated once at pipeline entry.
struct AnalysisConfig {
  int n_segments = 4;
  std::optional<double> max_dt;   // unset = no dropout filtering
  double brake_threshold = 0.15;  // 0..1
  double throttle_threshold = 0.25; // 0..1
};

// Throws ConfigError naming the first offending field.
void validate_config(const AnalysisConfig& cfg);

// Reads "key,value" lines on top of `base`. Accepts an optional "key,value"
// header; ignores '#' comments and blank lines. Unknown keys and unparseable
// values are skipped (logged). Result is not validated.
AnalysisConfig config_from_stream(std::istream& in, AnalysisConfig base = {});

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<AnalysisConfig> load_config_file(const std::string& path,
                                               AnalysisConfig base = {});

} // namespace ltbf
