#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <limits>
#include <sstream>

#include <ltbf/config.hpp>
#include <ltbf/errors.hpp>

using Catch::Approx;
using namespace ltbf;

TEST_CASE("AnalysisConfig defaults") {
  AnalysisConfig cfg;
  REQUIRE(cfg.n_segments == 4);
  REQUIRE_FALSE(cfg.max_dt.has_value());
  REQUIRE(cfg.brake_threshold == Approx(0.15));
  REQUIRE(cfg.throttle_threshold == Approx(0.25));
  REQUIRE_NOTHROW(validate_config(cfg));
}

TEST_CASE("validate_config rejects bad values") {
  SECTION("n_segments must be positive") {
    AnalysisConfig cfg;
    cfg.n_segments = 0;
    REQUIRE_THROWS_AS(validate_config(cfg), ConfigError);
    cfg.n_segments = -3;
    REQUIRE_THROWS_AS(validate_config(cfg), ConfigError);
  }

  SECTION("thresholds must lie in [0,1]") {
    AnalysisConfig cfg;
    cfg.brake_threshold = 1.2;
    REQUIRE_THROWS_AS(validate_config(cfg), ConfigError);

    cfg = AnalysisConfig{};
    cfg.throttle_threshold = -0.01;
    REQUIRE_THROWS_AS(validate_config(cfg), ConfigError);

    cfg = AnalysisConfig{};
    cfg.throttle_threshold = std::numeric_limits<double>::quiet_NaN();
    REQUIRE_THROWS_AS(validate_config(cfg), ConfigError);
  }

  SECTION("bounds are inclusive") {
    AnalysisConfig cfg;
    cfg.brake_threshold = 0.0;
    cfg.throttle_threshold = 1.0;
    REQUIRE_NOTHROW(validate_config(cfg));
  }

  SECTION("max_dt must be positive when set") {
    AnalysisConfig cfg;
    cfg.max_dt = 0.0;
    REQUIRE_THROWS_AS(validate_config(cfg), ConfigError);
    cfg.max_dt = 0.5;
    REQUIRE_NOTHROW(validate_config(cfg));
  }

  SECTION("error names the field") {
    AnalysisConfig cfg;
    cfg.n_segments = 0;
    try {
      validate_config(cfg);
      FAIL("expected ConfigError");
    } catch (const ConfigError& e) {
      REQUIRE(e.field() == "n_segments");
    }
  }
}

TEST_CASE("config_from_stream reads key,value lines") {
  std::istringstream ss(R"(key,value
# tuning for a short track
segments, 6
max_dt , 0.5
brake_threshold,0.2
throttle_threshold,0.3
colour,red
)");
  auto cfg = config_from_stream(ss);
  REQUIRE(cfg.n_segments == 6);
  REQUIRE(cfg.max_dt.value() == Approx(0.5));
  REQUIRE(cfg.brake_threshold == Approx(0.2));
  REQUIRE(cfg.throttle_threshold == Approx(0.3));
}

TEST_CASE("config_from_stream keeps base values for bad or missing entries") {
  AnalysisConfig base;
  base.n_segments = 8;
  base.max_dt = 1.0;
  std::istringstream ss("n_segments,2.5\nbrake_threshold,abc\nmax_dt,\n");
  auto cfg = config_from_stream(ss, base);
  REQUIRE(cfg.n_segments == 8);               // non-integer skipped
  REQUIRE(cfg.brake_threshold == Approx(0.15));
  REQUIRE_FALSE(cfg.max_dt.has_value());      // empty clears the filter
}

TEST_CASE("load_config_file returns nullopt on missing file") {
  REQUIRE_FALSE(load_config_file("no_such_config.csv").has_value());
}
