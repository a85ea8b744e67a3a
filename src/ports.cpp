#include <cwt/ports.hpp>
#include <utility>
#include <cwt/timing.hpp>

namespace cwt {

const char* to_string(FeedbackKind kind) {
  switch (kind) {
    case FeedbackKind::Correct:   return "correct";
    case FeedbackKind::Incorrect: return "incorrect";
    case FeedbackKind::Timeout:   return "timeout";
  }
  return "?";
}

void ClockedAudio::play_char(char c, double wpm, std::function<void(AudioResult)> done) {
  ++plays_;
  // A new tone supersedes one still playing; the old completion is dropped.
  if (active_ != 0) clock_.cancel_timer(active_);
  const Millis ms = char_duration_ms(c, wpm, extra_spacing_dits_);
  pending_ = std::move(done);
  active_ = clock_.schedule(ms, [this] {
    active_ = 0;
    auto cb = std::move(pending_);
    pending_ = nullptr;
    if (cb) cb(AudioResult::Completed);
  });
}

void ClockedAudio::stop_audio(std::function<void()> done) {
  if (active_ != 0) {
    clock_.cancel_timer(active_);
    active_ = 0;
    auto cb = std::move(pending_);
    pending_ = nullptr;
    if (cb) cb(AudioResult::Completed);
  }
  if (done) done();
}

} // namespace cwt
