#pragma once
#include <stdexcept>
#include <string>

namespace cwt {

enum class ErrorCode {
  InvalidWpm,                // wpm <= 0
  EffectiveExceedsCharacter, // Farnsworth effective speed above character speed
  Cancelled,                 // race arm or sleep interrupted; expected control flow
  AudioPlaybackFailed        // recovered locally, never fatal to an emission
};

const char* to_string(ErrorCode code);

// Thrown for timing precondition violations (InvalidWpm, EffectiveExceedsCharacter).
class MorseError : public std::invalid_argument {
public:
  MorseError(ErrorCode code, const std::string& what)
    : std::invalid_argument(what), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

private:
  ErrorCode code_;
};

} // namespace cwt
