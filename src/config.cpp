#include <cwt/config.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <utility>
#include <cwt/alphabet.hpp>
#include <cwt/log.hpp>
#include <cwt/words.hpp>

namespace cwt {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static double to_double_safe(const std::string& s, bool& ok) {
  try {
    size_t idx = 0;
    double v = std::stod(s, &idx);
    ok = idx == s.size();
    return v;
  } catch (const std::exception&) {
    ok = false;
    return 0.0;
  }
}

static std::optional<bool> to_bool(const std::string& s) {
  const auto v = lower(s);
  if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
  if (v == "false" || v == "no" || v == "off" || v == "0") return false;
  return std::nullopt;
}

const char* to_string(SessionMode m) {
  switch (m) {
    case SessionMode::Practice: return "practice";
    case SessionMode::Listen:   return "listen";
    case SessionMode::LiveCopy: return "live-copy";
    case SessionMode::WordPractice: return "word-practice";
  }
  return "practice";
}

std::optional<SessionMode> parse_session_mode(const std::string& s) {
  const auto v = lower(s);
  if (v == "practice") return SessionMode::Practice;
  if (v == "listen")   return SessionMode::Listen;
  if (v == "live-copy" || v == "livecopy" || v == "live_copy") return SessionMode::LiveCopy;
  if (v == "word-practice" || v == "words" || v == "word_practice") return SessionMode::WordPractice;
  return std::nullopt;
}

// Applies one key/value pair. Returns false if the key is unknown or the
// value does not parse.
static bool apply_setting(TrainerConfig& cfg, const std::string& key, const std::string& value) {
  bool ok = false;
  auto number = [&](double& field) {
    const double v = to_double_safe(value, ok);
    if (ok) field = v;
    return ok;
  };

  if (key == "wpm")                        return number(cfg.wpm);
  if (key == "farnsworth_wpm")             return number(cfg.farnsworth_wpm);
  if (key == "length_ms")                  return number(cfg.length_ms);
  if (key == "live_copy_offset_ms")        return number(cfg.live_copy_offset_ms);
  if (key == "display_update_interval_ms") return number(cfg.display_update_interval_ms);
  if (key == "extra_word_spacing_dits")    return number(cfg.extra_word_spacing_dits);
  if (key == "seed") {
    double v = 0.0;
    if (!number(v) || v < 0.0 || v != std::floor(v)) return false;
    if (v > static_cast<double>(std::numeric_limits<std::uint32_t>::max())) return false;
    cfg.seed = static_cast<std::uint32_t>(v);
    return true;
  }
  if (key == "mode") {
    auto m = parse_session_mode(value);
    if (m) cfg.mode = *m;
    return m.has_value();
  }
  if (key == "speed_tier") {
    auto t = parse_speed_tier(value);
    if (t) cfg.speed_tier = *t;
    return t.has_value();
  }
  if (key == "feedback") {
    auto f = parse_feedback_mode(value);
    if (f) cfg.feedback = *f;
    return f.has_value();
  }
  if (key == "replay") {
    auto b = to_bool(value);
    if (b) cfg.replay = *b;
    return b.has_value();
  }
  if (key == "alphabet") {
    std::string chars;
    for (char c : value) {
      const char u = to_upper_ascii(c);
      if (is_morse_char(u) && chars.find(u) == std::string::npos) chars.push_back(u);
    }
    if (chars.empty()) return false;
    cfg.alphabet = chars;
    return true;
  }
  if (key == "words") {
    auto words = parse_word_list(value);
    if (words.empty()) return false;
    cfg.words = std::move(words);
    return true;
  }
  return false;
}

TrainerConfig config_from_stream(std::istream& in, TrainerConfig base) {
  TrainerConfig cfg = std::move(base);
  std::string line;
  int line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::string raw = trim(line);
    if (raw.empty()) continue;
    if (raw[0] == '#') continue;

    const auto eq = raw.find('=');
    if (eq == std::string::npos) {
      log_warn("config line %d: expected key = value", line_no);
      continue;
    }
    const std::string key = lower(trim(raw.substr(0, eq)));
    const std::string value = trim(raw.substr(eq + 1));
    if (!apply_setting(cfg, key, value)) {
      log_warn("config line %d: ignoring '%s'", line_no, key.c_str());
    }
  }
  return cfg;
}

std::optional<TrainerConfig> load_config_file(const std::string& path, TrainerConfig base) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return config_from_stream(f, std::move(base));
}

std::vector<std::string> validate_config(const TrainerConfig& cfg) {
  std::vector<std::string> problems;
  if (!(cfg.wpm > 0.0)) problems.emplace_back("wpm must be positive");
  if (!(cfg.farnsworth_wpm > 0.0)) problems.emplace_back("farnsworth_wpm must be positive");
  else if (cfg.farnsworth_wpm > cfg.wpm) problems.emplace_back("farnsworth_wpm cannot exceed wpm");
  if (cfg.live_copy_offset_ms < 0.0) problems.emplace_back("live_copy_offset_ms cannot be negative");
  if (!(cfg.length_ms > 0.0)) problems.emplace_back("length_ms must be positive");
  if (cfg.alphabet.empty()) problems.emplace_back("alphabet is empty");
  return problems;
}

} // namespace cwt
