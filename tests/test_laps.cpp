#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>

#include <ltbf/laps.hpp>

using Catch::Approx;
using namespace ltbf;

static TelemetrySample at(double t, LapId lap, double speed = 100.0) {
  TelemetrySample s;
  s.timestamp = t;
  s.lap = lap;
  s.speed = speed;
  return s;
}

TEST_CASE("partition_laps groups by id and sorts by timestamp") {
  std::vector<TelemetrySample> in{
    at(3.0, 2), at(1.0, 1), at(2.0, 2), at(0.5, 1), at(1.5, 1)
  };
  auto laps = partition_laps(in);
  REQUIRE(laps.size() == 2);
  REQUIRE(laps[0].id == 1);
  REQUIRE(laps[1].id == 2);

  REQUIRE(laps[0].samples.size() == 3);
  REQUIRE(laps[0].samples[0].timestamp == Approx(0.5));
  REQUIRE(laps[0].samples[1].timestamp == Approx(1.0));
  REQUIRE(laps[0].samples[2].timestamp == Approx(1.5));
}

TEST_CASE("partition_laps keeps input order on equal timestamps") {
  std::vector<TelemetrySample> in{ at(1.0, 1, 10.0), at(1.0, 1, 20.0), at(0.0, 1, 30.0) };
  auto laps = partition_laps(in);
  REQUIRE(laps.size() == 1);
  REQUIRE(laps[0].samples[0].speed == Approx(30.0));
  REQUIRE(laps[0].samples[1].speed == Approx(10.0));
  REQUIRE(laps[0].samples[2].speed == Approx(20.0));
}

TEST_CASE("partition_laps drops laps with a single sample") {
  std::vector<TelemetrySample> in{ at(0.0, 1), at(1.0, 1), at(5.0, 7) };
  auto laps = partition_laps(in);
  REQUIRE(laps.size() == 1);
  REQUIRE(laps[0].id == 1);
}

TEST_CASE("partition_laps on empty input") {
  REQUIRE(partition_laps({}).empty());
}
