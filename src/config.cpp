#include <ltbf/config.hpp>
#include <cmath>
#include <fstream>
#include <spdlog/spdlog.h>
#include <ltbf/csv.hpp>
#include <ltbf/errors.hpp>

namespace ltbf {

static void check_unit_interval(const char* field, double v) {
  if (!std::isfinite(v) || v < 0.0 || v > 1.0) {
    throw ConfigError(field, "must be within [0, 1], got " + std::to_string(v));
  }
}

void validate_config(const AnalysisConfig& cfg) {
  if (cfg.n_segments < 1) {
    throw ConfigError("n_segments", "must be >= 1, got " + std::to_string(cfg.n_segments));
  }
  if (cfg.max_dt.has_value() && !(std::isfinite(*cfg.max_dt) && *cfg.max_dt > 0.0)) {
    throw ConfigError("max_dt", "must be a positive number, got " + std::to_string(*cfg.max_dt));
  }
  check_unit_interval("brake_threshold", cfg.brake_threshold);
  check_unit_interval("throttle_threshold", cfg.throttle_threshold);
}

static bool apply_entry(AnalysisConfig& cfg, const std::string& key, const std::string& value) {
  if (key == "max_dt" && value.empty()) {
    cfg.max_dt.reset();
    return true;
  }
  const auto v = parse_double(value);
  if (!v) return false;

  if (key == "n_segments" || key == "segments") {
    if (*v != std::floor(*v) || std::fabs(*v) > 1e9) return false;
    cfg.n_segments = static_cast<int>(*v);
  } else if (key == "max_dt") {
    cfg.max_dt = *v;
  } else if (key == "brake_threshold") {
    cfg.brake_threshold = *v;
  } else if (key == "throttle_threshold") {
    cfg.throttle_threshold = *v;
  } else {
    return false;
  }
  return true;
}

AnalysisConfig config_from_stream(std::istream& in, AnalysisConfig base) {
  AnalysisConfig cfg = base;
  std::string line;
  std::size_t line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    auto cols = split_csv_line(raw);
    if (cols.size() < 2) cols.emplace_back();
    if (cols[0] == "key" && cols[1] == "value") continue;

    if (!apply_entry(cfg, cols[0], cols[1])) {
      spdlog::warn("config line {}: ignoring '{}' = '{}'", line_no, cols[0], cols[1]);
    }
  }
  return cfg;
}

std::optional<AnalysisConfig> load_config_file(const std::string& path, AnalysisConfig base) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return config_from_stream(f, base);
}

} // namespace ltbf
