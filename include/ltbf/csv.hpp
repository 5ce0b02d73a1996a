#pragma once
#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace ltbf {

struct CsvRow {
  std::size_t line = 0;            // 1-based line in the source
  std::vector<std::string> fields; // trimmed
};

struct CsvTable {
  std::vector<std::string> header;
  std::vector<CsvRow> rows;

  // Index of a header column, nullopt if absent. Exact, case-sensitive match.
  std::optional<std::size_t> column(const std::string& name) const;
};

// Shared text helpers (no quoting support; fields are trimmed).
std::string trim(std::string s);
std::vector<std::string> split_csv_line(const std::string& line);

// Strict numeric parse: whole field must be consumed and the value finite.
std::optional<double> parse_double(const std::string& s);

// Stream-based reader (test-friendly; no filesystem required).
// First non-blank, non-comment line is the header. Lines starting with '#'
// and blank lines are ignored. Rows keep their field count even when it
// differs from the header.
CsvTable read_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<CsvTable> load_csv(const std::string& path);

} // namespace ltbf
