#pragma once
#include <optional>
#include <string>
#include <cwt/clock.hpp>

namespace cwt {

enum class SpeedTier { Slow, Medium, Fast, Lightning };

const char* to_string(SpeedTier tier);
std::optional<SpeedTier> parse_speed_tier(const std::string& s);

// All functions are pure. Invalid speeds throw MorseError.

// dit = 1200 / wpm. Throws InvalidWpm if wpm <= 0.
Millis dit_ms(double wpm);

// Tone-plus-gap length of one character: dit = 1, dah = 3, one dit between
// symbols. Space is 4 dits of silence plus extra_spacing_dits. Characters
// without a pattern last 0 ms.
Millis char_duration_ms(char c, double wpm, double extra_spacing_dits = 0.0);

// Fixed per tier, independent of speed.
Millis recognition_window_ms(SpeedTier tier);

// Recognition window with the max(60 ms, 1 dit) floor applied.
Millis effective_window_ms(SpeedTier tier, double wpm);

// 3 dits when the speeds match; otherwise ((60C - 37.2E) / (C*E)) * 1000,
// clamped to >= 0. Throws InvalidWpm or EffectiveExceedsCharacter.
Millis farnsworth_spacing_ms(double character_wpm, double effective_wpm);

// Standard 3-dit gap between characters.
Millis inter_character_spacing_ms(double wpm);

struct SpacingMs {
  Millis intra_symbol = 0.0; // 1 dit
  Millis character = 0.0;    // 3 dits
  Millis word = 0.0;         // 7 dits
};
SpacingMs spacing_ms(double wpm);

// Listen mode splits the character gap 66 / 34 around the reveal.
struct ListenTiming {
  Millis pre_reveal = 0.0;
  Millis post_reveal = 0.0;
};
ListenTiming listen_timing_ms(double character_wpm, double effective_wpm);

} // namespace cwt
