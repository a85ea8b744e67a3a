#include <cstdio>
#include <cwt/config.hpp>
#include <cwt/viewer/app.hpp>

using namespace cwt;

int main(int argc, char** argv) {
  TrainerConfig cfg;
  if (argc > 1) {
    auto loaded = load_config_file(argv[1]);
    if (!loaded) {
      std::fprintf(stderr, "cannot read config file '%s'\n", argv[1]);
      return 2;
    }
    cfg = *loaded;
  }
  const auto problems = validate_config(cfg);
  for (const auto& p : problems) std::fprintf(stderr, "invalid config: %s\n", p.c_str());
  if (!problems.empty()) return 2;

  TrainerApp app(cfg);
  return app.run();
}
