#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>

#include <ltbf/aggregate.hpp>

using Catch::Approx;
using namespace ltbf;

static SegmentLapRecord rec(LapId lap, int seg, double dt_sum,
                            double brake = 0.0, double exit = 0.0, double late = 0.0) {
  SegmentLapRecord r;
  r.lap = lap;
  r.segment = seg;
  r.dt_sum = dt_sum;
  r.brake_time = brake;
  r.exit_time = exit;
  r.late_throttle_time = late;
  return r;
}

TEST_CASE("aggregate_segments computes mean and best per segment") {
  std::vector<SegmentLapRecord> recs{
    rec(1, 0, 1.0), rec(1, 1, 2.0),
    rec(2, 0, 1.5), rec(2, 1, 1.0),
  };
  auto aggs = aggregate_segments(recs);
  REQUIRE(aggs.size() == 2);

  REQUIRE(aggs[0].segment == 0);
  REQUIRE(aggs[0].laps == 2);
  REQUIRE(aggs[0].avg_dt == Approx(1.25));
  REQUIRE(aggs[0].best_dt == Approx(1.0));
  REQUIRE(aggs[0].best.lap == 1);

  REQUIRE(aggs[1].segment == 1);
  REQUIRE(aggs[1].avg_dt == Approx(1.5));
  REQUIRE(aggs[1].best_dt == Approx(1.0));
  REQUIRE(aggs[1].best.lap == 2);
}

TEST_CASE("aggregate_segments keeps the best lap's sub-intervals") {
  std::vector<SegmentLapRecord> recs{
    rec(1, 0, 10.0, 3.0, 4.0, 1.0),
    rec(2, 0,  8.0, 2.0, 5.0, 0.5),
    rec(3, 0, 12.0, 4.0, 3.0, 2.1),
  };
  auto aggs = aggregate_segments(recs);
  REQUIRE(aggs.size() == 1);
  const auto& a = aggs[0];
  REQUIRE(a.best.lap == 2);
  REQUIRE(a.best.brake_time == Approx(2.0));
  REQUIRE(a.best.exit_time == Approx(5.0));
  REQUIRE(a.mean_brake_time == Approx(3.0));
  REQUIRE(a.mean_exit_time == Approx(4.0));
  REQUIRE(a.mean_late_throttle_time == Approx(1.2));
}

TEST_CASE("aggregate_segments averages throttle and coast time") {
  auto a = rec(1, 0, 4.0);
  a.throttle_time = 3.0;
  a.coast_time = 1.0;
  auto b = rec(2, 0, 5.0);
  b.throttle_time = 2.0;
  b.coast_time = 2.0;
  auto agg = aggregate_segments({a, b}).at(0);
  REQUIRE(agg.mean_throttle_time == Approx(2.5));
  REQUIRE(agg.mean_coast_time == Approx(1.5));
  REQUIRE(agg.best.coast_time == Approx(1.0));
}

TEST_CASE("aggregate_segments breaks best-time ties by lowest lap id") {
  std::vector<SegmentLapRecord> recs{
    rec(9, 0, 2.0, 1.0), rec(4, 0, 2.0, 0.5), rec(6, 0, 3.0)
  };
  auto a = aggregate_segments(recs).at(0);
  REQUIRE(a.best.lap == 4);
  REQUIRE(a.best.brake_time == Approx(0.5));
}

TEST_CASE("aggregate_segments omits segments without records") {
  std::vector<SegmentLapRecord> recs{ rec(1, 3, 1.0), rec(2, 0, 1.0) };
  auto aggs = aggregate_segments(recs);
  REQUIRE(aggs.size() == 2);
  REQUIRE(aggs[0].segment == 0);
  REQUIRE(aggs[1].segment == 3);
  REQUIRE(aggs[1].laps == 1);
  REQUIRE(aggs[1].avg_dt == Approx(aggs[1].best_dt));
}

TEST_CASE("aggregate_segments on no records") {
  REQUIRE(aggregate_segments({}).empty());
}
