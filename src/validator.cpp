#include <ltbf/validator.hpp>
#include <array>
#include <cmath>
#include <optional>
#include <utility>
#include <spdlog/spdlog.h>

namespace ltbf {

namespace {

enum Col : std::size_t { kTimestamp, kLap, kSpeed, kThrottle, kBrake, kSteering, kTrackPos, kColCount };

using ColumnMap = std::array<std::size_t, kColCount>;

ColumnMap resolve_columns(const CsvTable& table) {
  ColumnMap map{};
  std::vector<std::string> missing;
  const auto& names = required_columns();
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (auto idx = table.column(names[i]); idx.has_value()) map[i] = *idx;
    else missing.push_back(names[i]);
  }
  if (!missing.empty()) throw SchemaError(std::move(missing));
  return map;
}

inline double clamp01(double x) {
  return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
}

// Returns nullopt and fills `warn` when the row is unusable.
// Only the required cells are read; short or long rows are fine as long as
// every required column has a cell.
std::optional<TelemetrySample> parse_row(const CsvRow& row,
                                         const ColumnMap& map,
                                         RowParseWarning& warn) {
  warn.line = row.line;
  std::array<double, kColCount> v{};
  const auto& names = required_columns();
  for (std::size_t i = 0; i < kColCount; ++i) {
    if (map[i] >= row.fields.size()) {
      warn.column = names[i];
      warn.reason = "missing field (row has " + std::to_string(row.fields.size()) + ")";
      return std::nullopt;
    }
    const auto& raw = row.fields[map[i]];
    auto parsed = parse_double(raw);
    if (!parsed) {
      warn.column = names[i];
      warn.reason = raw.empty() ? "empty value" : "not a number: '" + raw + "'";
      return std::nullopt;
    }
    v[i] = *parsed;
  }

  if (v[kLap] != std::floor(v[kLap]) || std::fabs(v[kLap]) > 9.0e15) {
    warn.column = names[kLap];
    warn.reason = "lap id is not an integer";
    return std::nullopt;
  }

  TelemetrySample s;
  s.timestamp = v[kTimestamp];
  s.lap = static_cast<LapId>(v[kLap]);
  s.speed = v[kSpeed];
  s.throttle = v[kThrottle];
  s.brake = v[kBrake];
  s.steering = v[kSteering];
  s.track_position = clamp01(v[kTrackPos]);
  return s;
}

} // namespace

ValidationResult validate_samples(const CsvTable& table) {
  const ColumnMap map = resolve_columns(table);

  ValidationResult out;
  out.samples.reserve(table.rows.size());
  for (const auto& row : table.rows) {
    RowParseWarning warn;
    if (auto s = parse_row(row, map, warn); s.has_value()) {
      out.samples.push_back(*s);
    } else {
      spdlog::debug("dropping line {}: {}{}{}", warn.line, warn.column,
                    warn.column.empty() ? "" : ": ", warn.reason);
      out.warnings.push_back(std::move(warn));
    }
  }

  if (!out.warnings.empty()) {
    spdlog::warn("dropped {} of {} telemetry rows with unparseable values",
                 out.warnings.size(), table.rows.size());
  }
  return out;
}

} // namespace ltbf
