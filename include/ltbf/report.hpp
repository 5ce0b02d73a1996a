#pragma once
#include <ostream>
#include <string>
#include <vector>
#include <ltbf/attribution.hpp>

namespace ltbf {

// Manual emitters; fixed 9 significant digits so repeated runs match byte for byte.
// `time_loss` is the canonical loss field, `loss` its alias (same value).
// A missing loss_percent is written as null (JSON) or an empty cell (CSV).
void write_json(std::ostream& out, const std::vector<SegmentSummary>& rows);
void write_csv(std::ostream& out, const std::vector<SegmentSummary>& rows);

// Aligned text table for terminals; prints "No results" when empty.
void write_table(std::ostream& out, const std::vector<SegmentSummary>& rows);

// Dispatches on "json", "csv" or anything else (table), then flushes.
// Returns false if the stream failed at any point.
bool write_report(std::ostream& out, const std::string& format,
                  const std::vector<SegmentSummary>& rows);

} // namespace ltbf
