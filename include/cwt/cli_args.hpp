#pragma once
#include <optional>
#include <string>
#include <vector>
#include <cwt/clock.hpp>
#include <cwt/config.hpp>

namespace cwt {

struct CliOptions {
  std::string text;               // empty: random characters from the alphabet
  TrainerConfig config;
  std::string keys;               // scripted answers, one per character; '_' skips
  Millis latency_ms = 200.0;      // key delay after the window opens
  std::optional<std::string> config_path;
  bool help = false;
};

struct CliParseResult {
  std::optional<CliOptions> options;
  std::string error;
};

// Parses argv[1..argc). A --config file is applied first; flags override it.
CliParseResult parse_cli_args(const std::vector<std::string>& args);
CliParseResult parse_cli_args(int argc, const char* const* argv);

std::string cli_usage(const std::string& program);

} // namespace cwt
