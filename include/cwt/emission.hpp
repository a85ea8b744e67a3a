#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <cwt/cancel.hpp>
#include <cwt/clock.hpp>
#include <cwt/event_log.hpp>
#include <cwt/input_bus.hpp>
#include <cwt/ports.hpp>
#include <cwt/timing.hpp>
#include <cwt/words.hpp>

namespace cwt {

enum class Verdict { Correct, Incorrect, Timeout };

const char* to_string(Verdict v);

// One character's transmission instance. Immutable once created.
struct Emission {
  std::uint64_t id = 0;
  char ch = '\0';
  Millis started_at = 0.0;
  Millis window_close_at = 0.0; // predicted: start + tone + recognition window
};

struct PracticeOutcome {
  Verdict verdict = Verdict::Timeout;
  char expected = '\0';
  char got = '\0';         // key that settled the race, upper-cased; '\0' on timeout
  Millis latency_ms = 0.0; // from the moment input acceptance began
  Emission emission;
};

// Collaborators of a running emission. All must outlive it.
struct EmissionPorts {
  Clock& clock;
  InputBus& input;
  AudioPort& audio;
  FeedbackPort& feedback;
  EventLog& log;
};

struct EmissionTiming {
  double wpm = 20.0;
  double farnsworth_wpm = 20.0;
  SpeedTier tier = SpeedTier::Medium;
};

// Practice: play ch, then race correct key / other key / recognition window.
// Exactly one outcome is logged and fed back. Completes with std::nullopt if
// the session token fires; an in-flight tone still plays to completion first.
// A space resolves Correct with zero latency after its silence.
// Timing preconditions are checked before anything starts (throws MorseError).
void run_practice_emission(const EmissionPorts& io, const EmissionTiming& timing, char ch,
                           std::uint64_t id, const CancelToken& session,
                           Completion<PracticeOutcome> done);

// Listen: hide, log, play, wait the pre-reveal share of the Farnsworth gap,
// reveal, wait the rest.
void run_listen_emission(const EmissionPorts& io, const EmissionTiming& timing, char ch,
                         std::uint64_t id, const CancelToken& session,
                         Completion<Emission> done);

// Live copy: log, play, wait the Farnsworth gap. Keystrokes stay on the bus.
void run_live_copy_emission(const EmissionPorts& io, const EmissionTiming& timing, char ch,
                            std::uint64_t id, const CancelToken& session,
                            Completion<Emission> done);

// Time allowed to pick a word once playback has finished.
inline constexpr Millis kWordClickTimeoutMs = 2500.0;

struct WordOutcome {
  Verdict verdict = Verdict::Timeout;
  std::string word;
  std::string clicked;     // empty on timeout
  Millis latency_ms = 0.0; // click time minus the start of playback
  Millis started_at = 0.0;
  std::uint64_t id = 0;
};

// Word practice: play the word letter by letter with Farnsworth spacing
// between letters, call on_played, then race a click on one of the entry's
// candidates (the word or a distractor) against kWordClickTimeoutMs. A click
// is an InputEvent whose key is the whole candidate word.
void run_word_practice_emission(const EmissionPorts& io, const EmissionTiming& timing,
                                const WordEntry& entry, std::uint64_t id,
                                const CancelToken& session, std::function<void()> on_played,
                                Completion<WordOutcome> done);

} // namespace cwt
