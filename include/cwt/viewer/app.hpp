#pragma once
#include <cstddef>
#include <optional>
#include <vector>
#include <cwt/char_source.hpp>
#include <cwt/clock.hpp>
#include <cwt/config.hpp>
#include <cwt/event_log.hpp>
#include <cwt/input_bus.hpp>
#include <cwt/live_copy.hpp>
#include <cwt/ports.hpp>
#include <cwt/session.hpp>
#include <cwt/stats.hpp>

namespace cwt {

// RAII window that runs sessions on the wall clock and renders their state.
class TrainerApp {
public:
  explicit TrainerApp(const TrainerConfig& cfg);
  int run(); // returns 0 on normal exit

private:
  // Last cue and listen-mode reveal, drawn by the HUD.
  class CueFeedback : public FeedbackPort {
  public:
    explicit CueFeedback(const Clock& clock) : clock_(clock) {}
    void trigger(FeedbackKind kind, char c) override;
    void reveal(char c) override { revealed = c; }
    void hide() override { revealed.reset(); }

    std::optional<FeedbackKind> kind;
    char ch{'\0'};
    Millis at{0.0};
    std::optional<char> revealed;

  private:
    const Clock& clock_;
  };

  // Input & data flow
  void process_input_();
  void click_word_button_(std::size_t i);
  void pump_session_();
  void start_session_();
  // Rendering
  void render_frame_();
  void draw_history_(int y);
  void draw_live_copy_(int y);
  void draw_words_(int y);
  void draw_summary_(int y);
  void draw_hud_();

  TrainerConfig cfg_;
  SystemClock clock_;
  InputBus input_;
  ClockedAudio audio_;
  CueFeedback feedback_;
  EventLog log_;
  RandomCharSource source_;
  SessionRunner runner_;

  SessionSnapshot snap_{};
  std::size_t log_cursor_{0};
  std::vector<LogEvent> recent_;
  LiveCopyState live_{};
  Millis next_refresh_{0.0};
  std::optional<SessionStats> summary_;
};

} // namespace cwt
