#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <ltbf/logging.hpp>

using namespace ltbf;

TEST_CASE("use_stderr_logger routes the default logger to stderr only") {
  auto logger = use_stderr_logger("ltbf_test");
  REQUIRE(spdlog::default_logger() == logger);
  REQUIRE_FALSE(logger->sinks().empty());
  for (const auto& sink : logger->sinks()) {
    REQUIRE(std::dynamic_pointer_cast<spdlog::sinks::stderr_color_sink_mt>(sink) != nullptr);
    REQUIRE(std::dynamic_pointer_cast<spdlog::sinks::stdout_color_sink_mt>(sink) == nullptr);
  }
}

TEST_CASE("use_stderr_logger reuses an existing logger") {
  auto first = use_stderr_logger("ltbf_test_twice");
  auto second = use_stderr_logger("ltbf_test_twice");
  REQUIRE(first == second);
  REQUIRE(spdlog::default_logger() == second);
}
