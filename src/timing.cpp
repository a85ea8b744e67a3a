#include <cwt/timing.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>
#include <cwt/alphabet.hpp>
#include <cwt/error.hpp>

namespace cwt {

namespace {

constexpr double kDitNumerator = 1200.0;
constexpr double kDahDits = 3.0;
constexpr double kSpaceDits = 4.0;
constexpr double kCharGapDits = 3.0;
constexpr Millis kMinWindowMs = 60.0;

std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

} // namespace

const char* to_string(SpeedTier tier) {
  switch (tier) {
    case SpeedTier::Slow:      return "slow";
    case SpeedTier::Medium:    return "medium";
    case SpeedTier::Fast:      return "fast";
    case SpeedTier::Lightning: return "lightning";
  }
  return "medium";
}

std::optional<SpeedTier> parse_speed_tier(const std::string& s) {
  const auto v = lower(s);
  if (v == "slow")      return SpeedTier::Slow;
  if (v == "medium")    return SpeedTier::Medium;
  if (v == "fast")      return SpeedTier::Fast;
  if (v == "lightning") return SpeedTier::Lightning;
  return std::nullopt;
}

Millis dit_ms(double wpm) {
  if (!(wpm > 0.0)) {
    throw MorseError(ErrorCode::InvalidWpm, "WPM must be positive");
  }
  return kDitNumerator / wpm;
}

Millis char_duration_ms(char c, double wpm, double extra_spacing_dits) {
  const Millis dit = dit_ms(wpm);
  if (c == ' ') {
    return dit * (kSpaceDits + std::max(0.0, extra_spacing_dits));
  }
  const auto pattern = morse_pattern(c);
  if (!pattern) return 0.0;

  Millis total = 0.0;
  for (char sym : *pattern) {
    total += sym == '.' ? dit : dit * kDahDits;
  }
  if (pattern->size() > 1) {
    total += dit * static_cast<double>(pattern->size() - 1);
  }
  return total;
}

Millis recognition_window_ms(SpeedTier tier) {
  switch (tier) {
    case SpeedTier::Slow:      return 2000.0;
    case SpeedTier::Medium:    return 1000.0;
    case SpeedTier::Fast:      return 500.0;
    case SpeedTier::Lightning: return 300.0;
  }
  return 1000.0;
}

Millis effective_window_ms(SpeedTier tier, double wpm) {
  return std::max(recognition_window_ms(tier), std::max(kMinWindowMs, dit_ms(wpm)));
}

Millis farnsworth_spacing_ms(double character_wpm, double effective_wpm) {
  if (!(character_wpm > 0.0) || !(effective_wpm > 0.0)) {
    throw MorseError(ErrorCode::InvalidWpm, "WPM values must be positive");
  }
  if (effective_wpm > character_wpm) {
    throw MorseError(ErrorCode::EffectiveExceedsCharacter,
                     "Effective WPM cannot exceed character WPM");
  }
  if (effective_wpm == character_wpm) {
    return inter_character_spacing_ms(character_wpm);
  }
  const double c = character_wpm;
  const double e = effective_wpm;
  const Millis spacing = ((60.0 * c - 37.2 * e) / (c * e)) * 1000.0;
  return std::max(0.0, spacing);
}

Millis inter_character_spacing_ms(double wpm) {
  return dit_ms(wpm) * kCharGapDits;
}

SpacingMs spacing_ms(double wpm) {
  const Millis dit = dit_ms(wpm);
  return SpacingMs{dit * 1.0, dit * kCharGapDits, dit * 7.0};
}

ListenTiming listen_timing_ms(double character_wpm, double effective_wpm) {
  const Millis total = farnsworth_spacing_ms(character_wpm, effective_wpm);
  return ListenTiming{std::round(0.66 * total), std::round(0.34 * total)};
}

} // namespace cwt
