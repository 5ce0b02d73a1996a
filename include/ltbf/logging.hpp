#pragma once
#include <memory>
#include <string>
#include <spdlog/logger.h>

namespace ltbf {

// Makes a stderr logger named `name` the spdlog default, so stdout stays free
// for reports. Safe to call more than once; the same logger is reused.
std::shared_ptr<spdlog::logger> use_stderr_logger(const std::string& name = "ltbf");

} // namespace ltbf
