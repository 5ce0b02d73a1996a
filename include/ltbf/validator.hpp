#pragma once
#include <vector>
#include <ltbf/csv.hpp>
#include <ltbf/errors.hpp>
#include <ltbf/sample.hpp>

namespace ltbf {

struct ValidationResult {
  std::vector<TelemetrySample> samples;  // input order preserved
  std::vector<RowParseWarning> warnings; // one per dropped row
};

// Parses raw rows into samples.
// - Throws SchemaError listing every required column absent from the header.
// - Rows missing a required cell, with a non-numeric/non-finite required field
//   or with a non-integral lap id are dropped with a RowParseWarning.
//   Cells of other columns are never read, so they may be absent.
// - track_position is clamped to [0, 1]; other channels pass through.
ValidationResult validate_samples(const CsvTable& table);

} // namespace ltbf
