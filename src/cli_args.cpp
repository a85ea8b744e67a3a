#include <cwt/cli_args.hpp>
#include <stdexcept>
#include <utility>
#include <cwt/words.hpp>

namespace cwt {

namespace {

bool to_number(const std::string& s, double& out) {
  try {
    size_t idx = 0;
    out = std::stod(s, &idx);
    return idx == s.size();
  } catch (const std::exception&) {
    return false;
  }
}

struct Flag {
  std::string name;
  std::string value;
};

} // namespace

std::string cli_usage(const std::string& program) {
  return "usage: " + program +
         " [TEXT] [--mode practice|listen|live-copy|word-practice] [--wpm N]\n"
         "       [--farnsworth N] [--speed slow|medium|fast|lightning] [--keys TEXT]\n"
         "       [--latency MS] [--length MS] [--replay] [--feedback immediate|end]\n"
         "       [--words LIST] [--config FILE]\n"
         "In word-practice mode TEXT is the word list, and each --keys character\n"
         "answers one attempt: 'c' or '+' picks the word, '_' lets it time out,\n"
         "anything else picks a distractor.\n";
}

CliParseResult parse_cli_args(int argc, const char* const* argv) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
  return parse_cli_args(args);
}

CliParseResult parse_cli_args(const std::vector<std::string>& args) {
  CliParseResult res;
  CliOptions opt;
  std::vector<Flag> flags;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    if (a == "-h" || a == "--help") {
      opt.help = true;
      continue;
    }
    if (a == "--replay") {
      flags.push_back({a, "true"});
      continue;
    }
    if (a.rfind("--", 0) == 0) {
      if (i + 1 >= args.size()) {
        res.error = "missing value for " + a;
        return res;
      }
      flags.push_back({a, args[++i]});
      continue;
    }
    if (!opt.text.empty()) {
      res.error = "unexpected argument '" + a + "'";
      return res;
    }
    opt.text = a;
  }

  for (const auto& f : flags) {
    if (f.name == "--config") opt.config_path = f.value;
  }
  if (opt.config_path) {
    auto loaded = load_config_file(*opt.config_path);
    if (!loaded) {
      res.error = "cannot read config file '" + *opt.config_path + "'";
      return res;
    }
    opt.config = *loaded;
  }

  TrainerConfig& cfg = opt.config;
  for (const auto& f : flags) {
    double n = 0.0;
    if (f.name == "--config") {
      continue;
    } else if (f.name == "--mode") {
      auto m = parse_session_mode(f.value);
      if (!m) { res.error = "unknown mode '" + f.value + "'"; return res; }
      cfg.mode = *m;
    } else if (f.name == "--speed") {
      auto t = parse_speed_tier(f.value);
      if (!t) { res.error = "unknown speed tier '" + f.value + "'"; return res; }
      cfg.speed_tier = *t;
    } else if (f.name == "--feedback") {
      auto fb = parse_feedback_mode(f.value);
      if (!fb) { res.error = "unknown feedback mode '" + f.value + "'"; return res; }
      cfg.feedback = *fb;
    } else if (f.name == "--replay") {
      cfg.replay = true;
    } else if (f.name == "--keys") {
      opt.keys = f.value;
    } else if (f.name == "--words") {
      auto words = parse_word_list(f.value);
      if (words.empty()) { res.error = "no sendable words in '" + f.value + "'"; return res; }
      cfg.words = std::move(words);
    } else if (!to_number(f.value, n)) {
      res.error = "invalid number for " + f.name + ": '" + f.value + "'";
      return res;
    } else if (f.name == "--wpm") {
      cfg.wpm = n;
    } else if (f.name == "--farnsworth") {
      cfg.farnsworth_wpm = n;
    } else if (f.name == "--latency") {
      if (n < 0.0) { res.error = "--latency cannot be negative"; return res; }
      opt.latency_ms = n;
    } else if (f.name == "--length") {
      cfg.length_ms = n;
    } else {
      res.error = "unknown option " + f.name;
      return res;
    }
  }

  // A lone --wpm keeps standard spacing.
  bool wpm_given = false;
  bool farnsworth_given = false;
  for (const auto& f : flags) {
    wpm_given |= f.name == "--wpm";
    farnsworth_given |= f.name == "--farnsworth";
  }
  if (wpm_given && !farnsworth_given) cfg.farnsworth_wpm = cfg.wpm;

  bool words_given = false;
  for (const auto& f : flags) words_given |= f.name == "--words";
  if (cfg.mode == SessionMode::WordPractice && !words_given && !opt.text.empty()) {
    cfg.words = parse_word_list(opt.text);
    if (cfg.words.empty()) {
      res.error = "no sendable words in '" + opt.text + "'";
      return res;
    }
  }

  const auto problems = validate_config(cfg);
  if (!problems.empty()) {
    res.error = problems.front();
    return res;
  }

  res.options = std::move(opt);
  return res;
}

} // namespace cwt
