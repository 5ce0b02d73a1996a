#include <ltbf/errors.hpp>
#include <utility>

namespace ltbf {

static std::string join_names(const std::vector<std::string>& names) {
  std::string out;
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (i) out += ", ";
    out += names[i];
  }
  return out;
}

SchemaError::SchemaError(std::vector<std::string> missing)
  : std::runtime_error("Missing required columns: " + join_names(missing)),
    missing_(std::move(missing)) {}

ConfigError::ConfigError(std::string field, const std::string& message)
  : std::runtime_error("Invalid " + field + ": " + message),
    field_(std::move(field)) {}

} // namespace ltbf
