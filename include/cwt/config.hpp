#pragma once
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <cwt/clock.hpp>
#include <cwt/live_copy.hpp>
#include <cwt/timing.hpp>

namespace cwt {

enum class SessionMode { Practice, Listen, LiveCopy, WordPractice };

const char* to_string(SessionMode m);
std::optional<SessionMode> parse_session_mode(const std::string& s);

struct TrainerConfig {
  SessionMode mode = SessionMode::Practice;
  double wpm = 20.0;
  double farnsworth_wpm = 20.0;
  SpeedTier speed_tier = SpeedTier::Medium;
  Millis length_ms = 60000.0;
  Millis live_copy_offset_ms = 100.0;
  Millis display_update_interval_ms = 50.0;
  bool replay = false;
  double extra_word_spacing_dits = 0.0;
  FeedbackMode feedback = FeedbackMode::End;
  std::string alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789.,?/=";
  std::uint32_t seed = 0;
  std::vector<std::string> words; // word practice; empty: built-in list
};

// key = value lines; '#' comments and blank lines skipped. Unknown keys and
// unparsable values are ignored, keeping the default.
TrainerConfig config_from_stream(std::istream& in, TrainerConfig base = {});

// std::nullopt if the file cannot be opened.
std::optional<TrainerConfig> load_config_file(const std::string& path, TrainerConfig base = {});

// Empty when the configuration can drive a session.
std::vector<std::string> validate_config(const TrainerConfig& cfg);

} // namespace cwt
