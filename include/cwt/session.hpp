#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>
#include <cwt/cancel.hpp>
#include <cwt/char_source.hpp>
#include <cwt/config.hpp>
#include <cwt/emission.hpp>
#include <cwt/live_copy.hpp>
#include <cwt/words.hpp>

namespace cwt {

enum class SessionPhase { Idle, Running, Paused, Ended };

const char* to_string(SessionPhase p);

struct HistoryItem {
  char ch = '\0';
  std::optional<Verdict> verdict; // empty for listen mode
};

struct SessionCounters {
  int correct = 0;
  int incorrect = 0;
  int timeout = 0;
  double accuracy = 0.0; // percent of all outcomes
};

// Word practice view. A missed word is replayed until it is picked.
struct WordPracticeState {
  std::string current_word;         // empty between words
  std::vector<std::string> buttons; // the word and its distractors, shuffled per attempt
  bool playing = false;             // buttons are hidden while the word sounds
  std::optional<Verdict> flash;     // set for the flash after an attempt
  std::string clicked;
  int attempts = 0;
  int successes = 0;
  double accuracy = 0.0;
};

struct SessionSnapshot {
  SessionPhase phase = SessionPhase::Idle;
  std::optional<char> current_char;
  std::vector<HistoryItem> previous;
  Millis started_at = 0.0;
  Millis remaining_ms = 0.0;
  std::vector<TransmitEvent> emissions; // one slot per transmitted character
  SessionCounters stats;
  WordPracticeState word;
};

using SnapshotFn = std::function<void(const SessionSnapshot&)>;

// Drives one session at a time: picks characters, runs the mode's emission
// program for each, keeps history and publishes snapshots. Everything runs
// on the clock's executor; nothing blocks.
class SessionRunner {
public:
  SessionRunner(const EmissionPorts& io, CharSource& source);
  ~SessionRunner();
  SessionRunner(const SessionRunner&) = delete;
  SessionRunner& operator=(const SessionRunner&) = delete;

  // Stops any running session first. Throws MorseError for invalid speeds;
  // returns false (and logs why) for any other invalid setting.
  bool start(const TrainerConfig& cfg);
  // Aborts the session. An in-flight tone finishes before the end is logged.
  void stop();
  // Takes effect between emissions; paused time does not count against length.
  void pause();
  void resume();

  // fn receives the current snapshot immediately, then every update.
  std::uint64_t subscribe(SnapshotFn fn);
  void unsubscribe(std::uint64_t id);

  const SessionSnapshot& snapshot() const { return snapshot_; }
  const TrainerConfig& config() const { return cfg_; }
  bool paused() const { return paused_; } // requested, possibly not yet parked
  bool active() const {
    return snapshot_.phase == SessionPhase::Running || snapshot_.phase == SessionPhase::Paused;
  }

  // Log entries written by the current (or last) session.
  std::vector<LogEvent> session_events() const;

  // Live-copy view of the transmitted slots and visible keystrokes at now.
  LiveCopyState live_copy_state(Millis now) const;
  // Fully revealed view with every window closed.
  LiveCopyState live_copy_summary() const;

private:
  void step_();
  void prepare_(char ch);
  void after_practice_(const PracticeOutcome& out);
  void after_emission_(char ch, std::optional<Verdict> verdict);
  void count_outcome_(Verdict v);
  void step_word_();
  void after_word_(const WordOutcome& out);
  void sleep_then_step_(Millis ms);
  void end_();
  bool time_left_();
  void update_remaining_();
  void publish_();
  std::vector<LiveCopyEvent> live_copy_events_(Millis now) const;

  EmissionPorts io_;
  CharSource& source_;
  TrainerConfig cfg_;
  EmissionTiming timing_;
  SessionSnapshot snapshot_;
  std::unique_ptr<CancelSource> abort_;
  std::uint64_t generation_{0};
  std::uint64_t next_emission_id_{1};
  std::size_t log_begin_{0};

  std::optional<WordListSource> words_;
  std::optional<WordEntry> word_entry_; // kept across a retry
  std::mt19937 button_rng_;

  bool paused_{false};
  bool parked_{false}; // loop is waiting for resume()
  Millis paused_at_{0.0};
  Millis total_paused_ms_{0.0};

  std::vector<std::pair<std::uint64_t, SnapshotFn>> subscribers_;
  std::uint64_t next_sub_id_{1};
};

} // namespace cwt
