#include <cmath>
#include <fstream>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <spdlog/spdlog.h>

#include <ltbf/csv.hpp>
#include <ltbf/logging.hpp>
#include <ltbf/synth.hpp>

using namespace ltbf;

// ultra-light arg parser
struct Options {
  int laps = 30;               // --laps N
  int points = 3000;           // --points N (per lap)
  std::optional<unsigned> seed;// --seed N (random device when absent)
  std::string out_path = "big_telemetry.csv"; // --out file
};

static bool parse_int(const std::string& s, long long lo, long long hi, long long& out) {
  auto v = parse_double(s);
  if (!v || std::fabs(*v) > 1e15 || *v != std::floor(*v)) return false;
  out = static_cast<long long>(*v);
  return out >= lo && out <= hi;
}

static bool parse(int argc, char** argv, Options& o) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    if (i + 1 >= argc) {
      spdlog::error("missing value after {}", a);
      return false;
    }
    const std::string v(argv[++i]);
    long long n = 0;
    if (a == "--laps" && parse_int(v, 1, 100000, n))             o.laps = static_cast<int>(n);
    else if (a == "--points" && parse_int(v, 2, 10000000, n))    o.points = static_cast<int>(n);
    else if (a == "--seed" && parse_int(v, 0, 4294967295LL, n))  o.seed = static_cast<unsigned>(n);
    else if (a == "--out")                                       o.out_path = v;
    else {
      spdlog::error("bad argument: {} {}", a, v);
      return false;
    }
  }
  return true;
}

int main(int argc, char** argv) {
  use_stderr_logger("ltbf_gen");
  Options opt;
  if (!parse(argc, argv, opt)) {
    std::cerr << "usage: ltbf_gen [--laps N] [--points N] [--seed N] [--out FILE]\n";
    return 2;
  }

  std::mt19937 rng(opt.seed ? *opt.seed : std::random_device{}());
  const auto synth = synthesize_telemetry(SynthParams{opt.laps, opt.points}, rng);

  std::ofstream f(opt.out_path, std::ios::binary);
  if (!f) {
    spdlog::error("cannot write {}", opt.out_path);
    return 1;
  }
  if (!write_telemetry_csv(f, synth.samples)) {
    spdlog::error("write to {} failed", opt.out_path);
    return 1;
  }

  spdlog::info("created {}: {} rows, {} laps, {} samples per lap",
               opt.out_path, synth.samples.size(), opt.laps, opt.points);
  return 0;
}
