#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <cwt/cli_args.hpp>

using Catch::Approx;
using namespace cwt;

namespace {

std::filesystem::path write_temp_config(const std::string& name, const std::string& body) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path);
  out << body;
  return path;
}

} // namespace

TEST_CASE("no arguments gives the defaults") {
  const auto res = parse_cli_args(std::vector<std::string>{});
  REQUIRE(res.options.has_value());
  REQUIRE(res.error.empty());
  const auto& o = *res.options;
  REQUIRE(o.text.empty());
  REQUIRE(o.keys.empty());
  REQUIRE(o.latency_ms == Approx(200.0));
  REQUIRE_FALSE(o.help);
  REQUIRE(o.config.mode == SessionMode::Practice);
  REQUIRE(o.config.wpm == Approx(20.0));
}

TEST_CASE("flags and positional text") {
  const auto res = parse_cli_args({"PARIS PARIS", "--mode", "live-copy", "--wpm", "25",
                                   "--farnsworth", "12", "--speed", "fast", "--keys", "PA_IS",
                                   "--latency", "0", "--length", "30000", "--replay",
                                   "--feedback", "immediate"});
  REQUIRE(res.options.has_value());
  const auto& o = *res.options;
  REQUIRE(o.text == "PARIS PARIS");
  REQUIRE(o.keys == "PA_IS");
  REQUIRE(o.latency_ms == Approx(0.0));
  REQUIRE(o.config.mode == SessionMode::LiveCopy);
  REQUIRE(o.config.wpm == Approx(25.0));
  REQUIRE(o.config.farnsworth_wpm == Approx(12.0));
  REQUIRE(o.config.speed_tier == SpeedTier::Fast);
  REQUIRE(o.config.length_ms == Approx(30000.0));
  REQUIRE(o.config.replay);
  REQUIRE(o.config.feedback == FeedbackMode::Immediate);
}

TEST_CASE("a lone --wpm keeps standard spacing") {
  const auto res = parse_cli_args({"--wpm", "30"});
  REQUIRE(res.options.has_value());
  REQUIRE(res.options->config.farnsworth_wpm == Approx(30.0));
}

TEST_CASE("argc/argv overload skips the program name") {
  const char* argv[] = {"cwsim", "--help"};
  const auto res = parse_cli_args(2, argv);
  REQUIRE(res.options.has_value());
  REQUIRE(res.options->help);
  REQUIRE(res.options->text.empty());
}

TEST_CASE("bad command lines report an error") {
  auto fails_with = [](std::vector<std::string> args, const std::string& msg) {
    const auto res = parse_cli_args(args);
    REQUIRE_FALSE(res.options.has_value());
    REQUIRE(res.error == msg);
  };

  fails_with({"--wpm"}, "missing value for --wpm");
  fails_with({"--wpm", "fast"}, "invalid number for --wpm: 'fast'");
  fails_with({"--bogus", "5"}, "unknown option --bogus");
  fails_with({"--mode", "contest"}, "unknown mode 'contest'");
  fails_with({"--speed", "warp"}, "unknown speed tier 'warp'");
  fails_with({"--feedback", "never"}, "unknown feedback mode 'never'");
  fails_with({"--latency", "-5"}, "--latency cannot be negative");
  fails_with({"ABC", "DEF"}, "unexpected argument 'DEF'");
  fails_with({"--wpm", "10", "--farnsworth", "15"}, "farnsworth_wpm cannot exceed wpm");
  fails_with({"--length", "0"}, "length_ms must be positive");
  fails_with({"--config", "/nonexistent/cw.conf"}, "cannot read config file '/nonexistent/cw.conf'");
}

TEST_CASE("config file is applied before flags") {
  const auto path = write_temp_config("cwt_cli_args_test.conf",
                                      "mode = listen\n"
                                      "wpm = 25\n"
                                      "farnsworth_wpm = 15\n"
                                      "speed_tier = slow\n");

  SECTION("file values stand without flags") {
    const auto res = parse_cli_args({"--config", path.string()});
    REQUIRE(res.options.has_value());
    const auto& o = *res.options;
    REQUIRE(o.config_path == path.string());
    REQUIRE(o.config.mode == SessionMode::Listen);
    REQUIRE(o.config.wpm == Approx(25.0));
    REQUIRE(o.config.farnsworth_wpm == Approx(15.0));
    REQUIRE(o.config.speed_tier == SpeedTier::Slow);
  }

  SECTION("flags override the file regardless of order") {
    const auto res = parse_cli_args({"--speed", "lightning", "--config", path.string()});
    REQUIRE(res.options.has_value());
    REQUIRE(res.options->config.speed_tier == SpeedTier::Lightning);
    REQUIRE(res.options->config.mode == SessionMode::Listen);
  }

  std::filesystem::remove(path);
}

TEST_CASE("usage names the program") {
  const auto u = cli_usage("cwsim");
  REQUIRE(u.rfind("usage: cwsim", 0) == 0);
  REQUIRE(u.find("--farnsworth") != std::string::npos);
}

TEST_CASE("word practice takes its words from --words or the text") {
  SECTION("text becomes the word list") {
    const auto res = parse_cli_args({"the, rig cq", "--mode", "word-practice"});
    REQUIRE(res.options.has_value());
    REQUIRE(res.options->config.mode == SessionMode::WordPractice);
    REQUIRE(res.options->config.words == std::vector<std::string>{"THE", "RIG", "CQ"});
  }
  SECTION("--words wins over the text") {
    const auto res = parse_cli_args({"ignored", "--mode", "words", "--words", "ant,fb"});
    REQUIRE(res.options.has_value());
    REQUIRE(res.options->config.words == std::vector<std::string>{"ANT", "FB"});
  }
  SECTION("a list with nothing sendable is an error") {
    const auto res = parse_cli_args({"--words", "###"});
    REQUIRE_FALSE(res.options.has_value());
    REQUIRE(res.error.find("###") != std::string::npos);
  }
}
