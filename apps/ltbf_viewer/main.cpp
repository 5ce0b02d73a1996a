#include <iostream>
#include <ltbf/config.hpp>
#include <ltbf/logging.hpp>
#include <ltbf/viewer/app.hpp>

using namespace ltbf;

int main(int argc, char** argv) {
  use_stderr_logger("ltbf_viewer");
  if (argc < 2) {
    std::cerr << "usage: ltbf_viewer <telemetry.csv> [config.csv]\n";
    return 2;
  }

  AnalysisConfig cfg;
  if (argc >= 3) {
    auto loaded = load_config_file(argv[2]);
    if (!loaded) {
      std::cerr << "cannot open " << argv[2] << "\n";
      return 1;
    }
    cfg = *loaded;
  }

  ViewerApp app(argv[1], cfg);
  return app.run();
}
