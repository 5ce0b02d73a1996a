#include <ltbf/synth.hpp>
#include <algorithm>
#include <cstdio>

namespace ltbf {

static inline double clamp01(double x) {
  return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
}

const std::vector<CornerZone>& synth_corners() {
  static const std::vector<CornerZone> zones{
    {0.10, 0.18},
    {0.32, 0.40},
    {0.55, 0.65}, // hairpin
    {0.78, 0.86},
  };
  return zones;
}

SynthTelemetry synthesize_telemetry(const SynthParams& p, std::mt19937& rng) {
  SynthTelemetry out;
  const int laps = std::max(0, p.laps);
  const int points = std::max(0, p.points_per_lap);
  out.samples.reserve(static_cast<std::size_t>(laps) * static_cast<std::size_t>(points));
  out.plan.reserve(static_cast<std::size_t>(laps));

  const auto& corners = synth_corners();
  std::discrete_distribution<int> pick_weakness({0.35, 0.35, 0.30});
  std::uniform_int_distribution<std::size_t> pick_corner(0, corners.size() - 1);
  std::normal_distribution<double> jitter(0.0, 0.002);
  std::normal_distribution<double> speed_n(155.0, 4.0);
  std::normal_distribution<double> throttle_n(0.75, 0.1);
  std::normal_distribution<double> brake_n(0.05, 0.05);
  std::normal_distribution<double> steer_n(0.0, 0.15);
  std::normal_distribution<double> corner_steer_n(0.4, 0.1);

  double timestamp = 0.0;
  for (int lap = 1; lap <= laps; ++lap) {
    SynthLapPlan plan;
    plan.lap = lap;
    plan.weakness = static_cast<Weakness>(pick_weakness(rng));
    plan.weak_exit_corner = pick_corner(rng);
    plan.weak_brake_corner = pick_corner(rng);
    out.plan.push_back(plan);

    for (int i = 0; i < points; ++i) {
      const double pos = double(i) / double(points);
      double dt = 0.045 + jitter(rng); // ~22 Hz
      double speed = speed_n(rng);
      double throttle = clamp01(throttle_n(rng));
      double brake = clamp01(brake_n(rng));
      double steering = steer_n(rng);

      for (std::size_t c = 0; c < corners.size(); ++c) {
        const double c0 = corners[c].begin;
        const double c1 = corners[c].end;
        if (pos < c0 || pos > c1) continue;

        speed -= 40.0;
        throttle *= 0.55;
        brake += 0.4;
        steering += corner_steer_n(rng);

        const double len = c1 - c0;
        const double mid = 0.5 * (c0 + c1);
        const bool weak_brake = plan.weakness == Weakness::Braking && c == plan.weak_brake_corner;
        const bool weak_exit  = c == plan.weak_exit_corner;

        // Normal exit: back on throttle after the apex, brake released.
        if (pos > mid) {
          throttle = std::max(throttle, 0.60);
          brake = std::min(brake, weak_brake ? 0.22 : 0.10);
        }

        if (weak_brake && pos <= c0 + 0.40 * len) {
          dt += 0.060;
        }
        if (plan.weakness == Weakness::Exit && weak_exit && pos >= c1 - 0.15 * len) {
          dt += 0.020;
        }
        if (plan.weakness == Weakness::LateThrottle && weak_exit && pos > mid) {
          if (pos < c1 - 0.12 * len) {
            throttle = std::min(throttle, 0.12);
            brake = std::min(brake, 0.08);
            dt += 0.012;
          } else {
            throttle = std::max(throttle, 0.70);
            brake = std::min(brake, 0.05);
          }
        }
      }

      timestamp += dt;
      out.samples.push_back(TelemetrySample{timestamp, lap, speed, throttle, brake, steering, pos});
    }
  }
  return out;
}

bool write_telemetry_csv(std::ostream& out, const std::vector<TelemetrySample>& samples) {
  const auto& cols = required_columns();
  for (std::size_t i = 0; i < cols.size(); ++i) out << (i ? "," : "") << cols[i];
  out << "\n";

  char line[192];
  for (const auto& s : samples) {
    std::snprintf(line, sizeof(line), "%.6f,%lld,%.4f,%.4f,%.4f,%.4f,%.6f\n",
                  s.timestamp, static_cast<long long>(s.lap), s.speed, s.throttle,
                  s.brake, s.steering, s.track_position);
    out << line;
  }
  out.flush();
  return static_cast<bool>(out);
}

} // namespace ltbf
