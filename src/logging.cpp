#include <ltbf/logging.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace ltbf {

std::shared_ptr<spdlog::logger> use_stderr_logger(const std::string& name) {
  auto logger = spdlog::get(name);
  if (!logger) logger = spdlog::stderr_color_mt(name);
  spdlog::set_default_logger(logger);
  return logger;
}

} // namespace ltbf
