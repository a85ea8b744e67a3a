#include <cstdio>
#include <string>
#include <cwt/char_source.hpp>
#include <cwt/cli_args.hpp>
#include <cwt/clock.hpp>
#include <cwt/error.hpp>
#include <cwt/event_log.hpp>
#include <cwt/input_bus.hpp>
#include <cwt/log.hpp>
#include <cwt/ports.hpp>
#include <cwt/session.hpp>
#include <cwt/stats.hpp>
#include <cwt/timing.hpp>

using namespace cwt;

namespace {

// Prints cues as they fire so the transcript reads in order.
class PrintingFeedback : public FeedbackPort {
public:
  explicit PrintingFeedback(const Clock& clock) : clock_(clock) {}
  void trigger(FeedbackKind kind, char c) override {
    std::printf("  [%9.1f] feedback %-9s '%c'\n", clock_.now(), to_string(kind), c);
  }
  void reveal(char c) override { std::printf("  [%9.1f] reveal '%c'\n", clock_.now(), c); }

private:
  const Clock& clock_;
};

void print_live_copy(const LiveCopyState& st) {
  const auto view = results_view(st.display);
  std::printf("\nsent:   %s\n", cells_text(view.correct_text).c_str());
  std::printf("copied: %s\n", cells_text(view.user_copy).c_str());
  std::printf("score:  %d correct, %d wrong, %d missed of %d (%d%%)\n", st.score.correct,
              st.score.wrong, st.score.missed, st.score.total, st.score.accuracy);
}

void print_words(const WordPracticeState& w) {
  std::printf("\nwords: %d of %d attempts picked (%.1f%%)\n", w.successes, w.attempts, w.accuracy);
}

void print_stats(const SessionStats& s) {
  std::printf("\nduration %.1f ms, %d outcomes: %d correct, %d incorrect, %d timeout\n",
              s.duration_ms, s.total, s.correct, s.incorrect, s.timeout);
  std::printf("accuracy %.1f%%, timeouts %.1f%%, latency mean %.1f ms / median %.1f ms, %d wpm\n",
              s.accuracy, s.timeout_percentage, s.mean_latency_ms, s.median_latency_ms,
              s.achieved_wpm);
  for (const auto& [expected, row] : s.confusion) {
    for (const auto& [got, count] : row) {
      std::printf("  confused '%c' -> '%c' x%d\n", expected, got, count);
    }
  }
}

} // namespace

int main(int argc, char** argv) {
  const auto parsed = parse_cli_args(argc, argv);
  if (!parsed.options) {
    std::fprintf(stderr, "cwsim: %s\n%s", parsed.error.c_str(), cli_usage("cwsim").c_str());
    return 2;
  }
  const CliOptions& opt = *parsed.options;
  if (opt.help) {
    std::printf("%s", cli_usage("cwsim").c_str());
    return 0;
  }

  FakeClock clock;
  InputBus input(clock);
  ClockedAudio audio(clock, opt.config.extra_word_spacing_dits);
  PrintingFeedback feedback(clock);
  EventLog log;
  EmissionPorts io{clock, input, audio, feedback, log};

  TextCharSource text_source(opt.text);
  RandomCharSource random_source(opt.config.alphabet, opt.config.seed);
  CharSource& source = opt.text.empty() ? static_cast<CharSource&>(random_source)
                                        : static_cast<CharSource&>(text_source);

  TrainerConfig cfg = opt.config;
  const bool words = cfg.mode == SessionMode::WordPractice;
  // A given text is sent once; without one the session runs for its length.
  // In word practice the text is the word list instead.
  std::size_t limit = 0;
  if (!opt.text.empty() && !words) {
    limit = text_source.size();
    cfg.length_ms = 1e12;
  }

  SessionRunner runner(io, source);
  std::size_t scripted = 0;
  int clicked_attempt = -1;
  runner.subscribe([&](const SessionSnapshot& s) {
    if (s.phase != SessionPhase::Running) return;
    if (words) {
      const auto& w = s.word;
      const auto attempt = static_cast<std::size_t>(w.attempts);
      if (!opt.keys.empty() && attempt >= opt.keys.size() && !w.flash) {
        runner.stop();
        return;
      }
      // Click once per attempt, when the buttons appear.
      if (w.current_word.empty() || w.playing || w.flash || clicked_attempt == w.attempts) return;
      clicked_attempt = w.attempts;
      const char key = attempt < opt.keys.size() ? opt.keys[attempt] : '_';
      if (key == '_') return;
      std::string pick = w.current_word;
      if (key != 'c' && key != '+') {
        pick.clear();
        for (const auto& b : w.buttons) {
          if (b != w.current_word) { pick = b; break; }
        }
        if (pick.empty()) return;
      }
      input.push(InputEvent{clock.now() + opt.latency_ms, pick});
      return;
    }
    // Script a keystroke for each newly started slot.
    while (scripted < s.emissions.size()) {
      const auto& slot = s.emissions[scripted];
      const char key = scripted < opt.keys.size() ? opt.keys[scripted] : '_';
      ++scripted;
      if (key == '_' || slot.ch == ' ') continue;
      const Millis opens = cfg.mode == SessionMode::LiveCopy
                             ? slot.start_time
                             : slot.start_time + char_duration_ms(slot.ch, cfg.wpm);
      input.push(InputEvent{opens + opt.latency_ms, std::string(1, key)});
    }
    if (limit > 0 && s.emissions.size() >= limit && !s.current_char) runner.stop();
  });

  try {
    if (!runner.start(cfg)) return 2;
  } catch (const MorseError& e) {
    std::fprintf(stderr, "cwsim: %s (%s)\n", e.what(), to_string(e.code()));
    return 2;
  }

  while (runner.active() && clock.step()) {
  }
  if (runner.active()) runner.stop();

  for (const auto& ev : runner.session_events()) {
    std::printf("%s\n", format_event(ev).c_str());
  }
  if (cfg.mode == SessionMode::LiveCopy) print_live_copy(runner.live_copy_summary());
  if (words) print_words(runner.snapshot().word);
  if (auto stats = compute_session_stats(runner.session_events(), cfg.mode)) {
    print_stats(*stats);
  }
  return 0;
}
