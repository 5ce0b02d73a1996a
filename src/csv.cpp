#include <ltbf/csv.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <utility>

namespace ltbf {

std::optional<std::size_t> CsvTable::column(const std::string& name) const {
  auto it = std::find(header.begin(), header.end(), name);
  if (it == header.end()) return std::nullopt;
  return static_cast<std::size_t>(it - header.begin());
}

std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

std::optional<double> parse_double(const std::string& s) {
  if (s.empty()) return std::nullopt;
  errno = 0;
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size()) return std::nullopt;
  if (errno == ERANGE || !std::isfinite(v)) return std::nullopt;
  return v;
}

CsvTable read_csv_stream(std::istream& in) {
  CsvTable table;
  std::string line;
  std::size_t line_no = 0;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    ++line_no;
    std::string raw = trim(line); // also drops a trailing '\r'
    if (raw.empty()) continue;
    if (raw[0] == '#') continue;

    auto cols = split_csv_line(raw);
    if (!header_consumed) {
      table.header = std::move(cols);
      header_consumed = true;
      continue;
    }
    table.rows.push_back(CsvRow{line_no, std::move(cols)});
  }
  return table;
}

std::optional<CsvTable> load_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return read_csv_stream(f);
}

} // namespace ltbf
