#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>

#include <ltbf/lap_metrics.hpp>

using Catch::Approx;
using namespace ltbf;

struct Row { double t, pos, speed, throttle, brake; };

static Lap make_lap(LapId id, const std::vector<Row>& rows) {
  Lap lap;
  lap.id = id;
  for (const auto& r : rows) {
    TelemetrySample s;
    s.timestamp = r.t;
    s.lap = id;
    s.track_position = r.pos;
    s.speed = r.speed;
    s.throttle = r.throttle;
    s.brake = r.brake;
    lap.samples.push_back(s);
  }
  return lap;
}

static std::vector<SegmentLapRecord> records_for(const Lap& lap, const AnalysisConfig& cfg) {
  return segment_lap_records(lap, lap_deltas(lap, cfg), cfg);
}

TEST_CASE("segment_lap_records: corner with brake, apex and throttle pickup") {
  // dt per pair: 1, 2, 1, 2, 1; apex (min speed) is the second pair's sample
  auto lap = make_lap(3, {
    {0.0, 0.00, 100, 0.8, 0.0},
    {1.0, 0.10,  90, 0.0, 0.5},
    {3.0, 0.20,  60, 0.0, 0.3},
    {4.0, 0.30,  70, 0.1, 0.0},
    {6.0, 0.40,  80, 0.6, 0.0},
    {7.0, 0.50,  95, 0.9, 0.0},
  });
  AnalysisConfig cfg;
  cfg.n_segments = 1;

  auto recs = records_for(lap, cfg);
  REQUIRE(recs.size() == 1);
  const auto& r = recs[0];
  REQUIRE(r.lap == 3);
  REQUIRE(r.segment == 0);

  REQUIRE(r.dt_sum == Approx(7.0));
  // averages over the later sample of each pair (first sample excluded)
  REQUIRE(r.avg_speed == Approx(79.0));
  REQUIRE(r.avg_throttle == Approx(0.32));
  REQUIRE(r.avg_brake == Approx(0.16));

  REQUIRE(r.brake_time == Approx(3.0));
  REQUIRE(r.throttle_time == Approx(3.0));
  REQUIRE(r.coast_time == Approx(1.0));
  REQUIRE(r.entry_time == Approx(3.0));
  REQUIRE(r.exit_time == Approx(3.0));
  REQUIRE(r.late_throttle_time == Approx(3.0));
}

TEST_CASE("segment_lap_records: late throttle is zero without re-application") {
  AnalysisConfig cfg;
  cfg.n_segments = 1;

  SECTION("throttle never comes back after the apex") {
    auto lap = make_lap(1, {
      {0.0, 0.0, 100, 0.0, 0.0},
      {1.0, 0.1,  80, 0.0, 0.4},
      {2.0, 0.2,  50, 0.0, 0.0},
      {3.0, 0.3,  55, 0.2, 0.0},
    });
    auto r = records_for(lap, cfg).at(0);
    REQUIRE(r.late_throttle_time == Approx(0.0));
    REQUIRE(r.exit_time == Approx(0.0));
  }

  SECTION("apex is the last sample") {
    auto lap = make_lap(1, {
      {0.0, 0.0, 100, 0.9, 0.0},
      {1.0, 0.1,  80, 0.9, 0.0},
      {2.0, 0.2,  50, 0.0, 0.9},
    });
    auto r = records_for(lap, cfg).at(0);
    REQUIRE(r.late_throttle_time == Approx(0.0));
    REQUIRE(r.entry_time == Approx(2.0));
    // throttle on from the first pair: the whole group is powered
    REQUIRE(r.exit_time == Approx(2.0));
  }
}

TEST_CASE("segment_lap_records: first of equal minimum speeds is the apex") {
  auto lap = make_lap(1, {
    {0.0, 0.0, 100, 0.0, 0.0},
    {1.0, 0.1,  50, 0.0, 0.0},
    {2.0, 0.2,  50, 0.0, 0.0},
    {4.0, 0.3,  70, 0.5, 0.0},
  });
  AnalysisConfig cfg;
  cfg.n_segments = 1;
  auto r = records_for(lap, cfg).at(0);
  REQUIRE(r.entry_time == Approx(1.0));
  REQUIRE(r.late_throttle_time == Approx(3.0));
}

TEST_CASE("segment_lap_records: one record per segment with data") {
  // n=4; nothing lands in S2 (index 1), the 0.20 -> 0.55 jump counts toward S3
  auto lap = make_lap(2, {
    {0.0, 0.05, 100, 0.5, 0.0},
    {1.0, 0.10, 100, 0.5, 0.0},
    {2.0, 0.20, 100, 0.5, 0.0},
    {3.5, 0.55, 100, 0.5, 0.0},
    {4.0, 0.80, 100, 0.5, 0.0},
  });
  AnalysisConfig cfg;
  cfg.n_segments = 4;
  auto recs = records_for(lap, cfg);
  REQUIRE(recs.size() == 3);
  REQUIRE(recs[0].segment == 0);
  REQUIRE(recs[0].dt_sum == Approx(2.0));
  REQUIRE(recs[1].segment == 2);
  REQUIRE(recs[1].dt_sum == Approx(1.5));
  REQUIRE(recs[2].segment == 3);
  REQUIRE(recs[2].dt_sum == Approx(0.5));
}

TEST_CASE("segment_lap_records: thresholds are inclusive") {
  auto lap = make_lap(1, {
    {0.0, 0.0, 100, 0.0, 0.0},
    {1.0, 0.1, 100, 0.25, 0.15},
  });
  AnalysisConfig cfg;
  cfg.n_segments = 1;
  auto r = records_for(lap, cfg).at(0);
  REQUIRE(r.brake_time == Approx(1.0));
  REQUIRE(r.throttle_time == Approx(1.0));
  REQUIRE(r.coast_time == Approx(0.0));
}
