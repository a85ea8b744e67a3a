#include <cwt/error.hpp>

namespace cwt {

const char* to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::InvalidWpm:                return "InvalidWpm";
    case ErrorCode::EffectiveExceedsCharacter: return "EffectiveExceedsCharacter";
    case ErrorCode::Cancelled:                 return "Cancelled";
    case ErrorCode::AudioPlaybackFailed:       return "AudioPlaybackFailed";
  }
  return "Unknown";
}

} // namespace cwt
