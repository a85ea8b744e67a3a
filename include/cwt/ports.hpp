#pragma once
#include <functional>
#include <cwt/clock.hpp>

namespace cwt {

enum class AudioResult { Completed, Failed };

// Tone output. play_char completes once playback is audibly over (or the
// device failed); stop_audio completes once any in-flight tone is silenced.
class AudioPort {
public:
  virtual ~AudioPort() = default;
  virtual void play_char(char c, double wpm, std::function<void(AudioResult)> done) = 0;
  virtual void stop_audio(std::function<void()> done) = 0;
};

enum class FeedbackKind { Correct, Incorrect, Timeout };

const char* to_string(FeedbackKind kind);

// Fire-and-forget cues. reveal/hide drive the listen-mode character display.
class FeedbackPort {
public:
  virtual ~FeedbackPort() = default;
  virtual void trigger(FeedbackKind kind, char c) = 0;
  virtual void reveal(char) {}
  virtual void hide() {}
};

class NullFeedback : public FeedbackPort {
public:
  void trigger(FeedbackKind, char) override {}
};

// Silent audio that lasts exactly the character's duration on the clock.
class ClockedAudio : public AudioPort {
public:
  explicit ClockedAudio(Clock& clock, double extra_spacing_dits = 0.0)
    : clock_(clock), extra_spacing_dits_(extra_spacing_dits) {}

  // Starting a tone while another plays replaces it.
  void play_char(char c, double wpm, std::function<void(AudioResult)> done) override;
  // Ends an in-flight tone early; its play_char completes as Completed.
  void stop_audio(std::function<void()> done) override;

  bool playing() const { return active_ != 0; }
  int plays() const { return plays_; }

private:
  Clock& clock_;
  double extra_spacing_dits_;
  TimerId active_{0};
  std::function<void(AudioResult)> pending_;
  int plays_{0};
};

} // namespace cwt
