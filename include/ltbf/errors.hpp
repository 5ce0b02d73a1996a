#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace ltbf {

// Required column(s) absent from the input header. Fatal.
class SchemaError : public std::runtime_error {
public:
  explicit SchemaError(std::vector<std::string> missing);
  const std::vector<std::string>& missing() const { return missing_; }

private:
  std::vector<std::string> missing_;
};

// Invalid analysis parameters. Raised before any processing starts.
class ConfigError : public std::runtime_error {
public:
  ConfigError(std::string field, const std::string& message);
  const std::string& field() const { return field_; }

private:
  std::string field_;
};

// A dropped input row. Recoverable; collected, never thrown.
struct RowParseWarning {
  std::size_t line = 0;  // 1-based source line
  std::string column;    // offending column, empty for shape errors
  std::string reason;
};

} // namespace ltbf
