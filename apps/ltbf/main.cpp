#include <cmath>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

#include <ltbf/analyzer.hpp>
#include <ltbf/config.hpp>
#include <ltbf/csv.hpp>
#include <ltbf/logging.hpp>
#include <ltbf/report.hpp>

using namespace ltbf;

namespace {

// ultra-light arg parser
struct Options {
  std::string input;           // positional telemetry CSV
  std::string config_path;     // --config cfg.csv
  std::string format = "table";// --format json|csv|table
  std::string out_path;        // --out file (default stdout)
  bool verbose = false;        // --verbose
  bool quiet = false;          // --quiet
  bool help = false;
  // Flag overrides applied on top of the config file
  std::optional<std::string> segments, max_dt, brake, throttle;
};

void usage() {
  std::cerr <<
    "usage: ltbf <telemetry.csv> [--segments N] [--max-dt S]\n"
    "            [--brake-threshold X] [--throttle-threshold X]\n"
    "            [--config FILE] [--format json|csv|table] [--out FILE]\n"
    "            [--verbose|--quiet]\n";
}

bool parse(int argc, char** argv, Options& o) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto next = [&](auto& tgt) {
      if (i + 1 >= argc) {
        spdlog::error("missing value after {}", a);
        return false;
      }
      tgt = argv[++i];
      return true;
    };
    bool ok = true;
    if (a == "--segments" || a == "--n-segments") ok = next(o.segments);
    else if (a == "--max-dt")                   ok = next(o.max_dt);
    else if (a == "--brake-threshold")          ok = next(o.brake);
    else if (a == "--throttle-threshold")       ok = next(o.throttle);
    else if (a == "--config")                   ok = next(o.config_path);
    else if (a == "--format")                   ok = next(o.format);
    else if (a == "--out")                      ok = next(o.out_path);
    else if (a == "--verbose")                  o.verbose = true;
    else if (a == "--quiet")                    o.quiet = true;
    else if (a == "-h" || a == "--help")        o.help = true;
    else if (!a.empty() && a[0] != '-' && o.input.empty()) o.input = a;
    else {
      spdlog::error("unknown argument: {}", a);
      ok = false;
    }
    if (!ok) return false;
  }
  return true;
}

// Builds the config: defaults <- file <- flags. Throws ConfigError on bad flag values.
AnalysisConfig build_config(const Options& o) {
  AnalysisConfig cfg;
  if (!o.config_path.empty()) {
    auto loaded = load_config_file(o.config_path, cfg);
    if (!loaded) throw ConfigError("config", "cannot open " + o.config_path);
    cfg = *loaded;
  }

  auto number = [](const char* field, const std::string& s) {
    auto v = parse_double(s);
    if (!v) throw ConfigError(field, "not a number: '" + s + "'");
    return *v;
  };
  if (o.segments) {
    const double n = number("n_segments", *o.segments);
    if (std::fabs(n) > 1e9 || n != std::floor(n)) {
      throw ConfigError("n_segments", "must be an integer, got '" + *o.segments + "'");
    }
    cfg.n_segments = static_cast<int>(n);
  }
  if (o.max_dt) {
    if (o.max_dt->empty()) cfg.max_dt.reset();
    else cfg.max_dt = number("max_dt", *o.max_dt);
  }
  if (o.brake)    cfg.brake_threshold = number("brake_threshold", *o.brake);
  if (o.throttle) cfg.throttle_threshold = number("throttle_threshold", *o.throttle);
  return cfg;
}

} // namespace

int main(int argc, char** argv) {
  use_stderr_logger();
  Options opt;
  if (!parse(argc, argv, opt) || opt.help || opt.input.empty()) {
    usage();
    return opt.help ? 0 : 2;
  }
  if (opt.format != "json" && opt.format != "csv" && opt.format != "table") {
    spdlog::error("unknown format: {}", opt.format);
    usage();
    return 2;
  }
  if (opt.verbose) spdlog::set_level(spdlog::level::debug);
  if (opt.quiet)   spdlog::set_level(spdlog::level::err);

  try {
    const AnalysisConfig cfg = build_config(opt);
    auto report = analyze_csv_file(opt.input, cfg);
    if (!report) {
      spdlog::error("cannot open {}", opt.input);
      return 1;
    }
    if (!report->warnings.empty()) {
      spdlog::warn("{} row(s) dropped while parsing {}", report->warnings.size(), opt.input);
    }

    if (opt.out_path.empty()) {
      if (!write_report(std::cout, opt.format, report->segments)) {
        spdlog::error("write to stdout failed");
        return 1;
      }
    } else {
      std::ofstream f(opt.out_path, std::ios::binary);
      if (!f) {
        spdlog::error("cannot write {}", opt.out_path);
        return 1;
      }
      if (!write_report(f, opt.format, report->segments)) {
        spdlog::error("write to {} failed", opt.out_path);
        return 1;
      }
      spdlog::info("wrote {} segment(s) to {}", report->segments.size(), opt.out_path);
    }
  } catch (const ConfigError& e) {
    spdlog::error("{}", e.what());
    return 2;
  } catch (const SchemaError& e) {
    spdlog::error("{}", e.what());
    return 3;
  }
  return 0;
}
