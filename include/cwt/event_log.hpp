#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include <cwt/clock.hpp>

namespace cwt {

enum class LogEventKind { SessionStart, SessionEnd, Emission, Correct, Incorrect, Timeout };

const char* to_string(LogEventKind kind);

// One entry of the session log. For Incorrect, ch is the expected character
// and got the key that was pressed; got is '\0' otherwise.
// Word practice entries leave ch empty and carry word (and got_word).
struct LogEvent {
  LogEventKind kind = LogEventKind::Emission;
  Millis at = 0.0;
  char ch = '\0';
  char got = '\0';
  Millis latency_ms = 0.0; // Correct only
  std::string word;
  std::string got_word;

  static LogEvent session_start(Millis at) { return {LogEventKind::SessionStart, at}; }
  static LogEvent session_end(Millis at)   { return {LogEventKind::SessionEnd, at}; }
  static LogEvent emission(Millis at, char c) { return {LogEventKind::Emission, at, c}; }
  static LogEvent correct(Millis at, char c, Millis latency) {
    return {LogEventKind::Correct, at, c, '\0', latency};
  }
  static LogEvent incorrect(Millis at, char expected, char got) {
    return {LogEventKind::Incorrect, at, expected, got};
  }
  static LogEvent timeout(Millis at, char c) { return {LogEventKind::Timeout, at, c}; }

  static LogEvent word_emission(Millis at, std::string w) {
    return {LogEventKind::Emission, at, '\0', '\0', 0.0, std::move(w)};
  }
  static LogEvent word_correct(Millis at, std::string w, Millis latency) {
    return {LogEventKind::Correct, at, '\0', '\0', latency, std::move(w)};
  }
  static LogEvent word_incorrect(Millis at, std::string expected, std::string clicked) {
    return {LogEventKind::Incorrect, at, '\0', '\0', 0.0, std::move(expected), std::move(clicked)};
  }
  static LogEvent word_timeout(Millis at, std::string w) {
    return {LogEventKind::Timeout, at, '\0', '\0', 0.0, std::move(w)};
  }

  bool is_word() const { return !word.empty(); }

  bool is_outcome() const {
    return kind == LogEventKind::Correct || kind == LogEventKind::Incorrect ||
           kind == LogEventKind::Timeout;
  }
};

// "emission 1250.0 A", "incorrect 1800.0 A->N", ...
std::string format_event(const LogEvent& ev);

// Append-only, single-writer session log with non-decreasing timestamps.
class EventLog {
public:
  // Rejects (returns false) an event older than the last one appended.
  bool append(const LogEvent& ev);

  const std::vector<LogEvent>& events() const { return events_; }
  std::size_t size() const { return events_.size(); }
  bool empty() const { return events_.empty(); }

  // Copies everything appended since cursor into out and advances cursor.
  // Returns false if nothing new arrived.
  bool read_since(std::size_t& cursor, std::vector<LogEvent>& out) const;

  // Bumped on every append; lets a reader skip work when nothing changed.
  std::uint64_t sequence() const { return seq_; }

private:
  std::vector<LogEvent> events_;
  std::uint64_t seq_{0};
};

// append() for writers that cannot act on a rejection: a regressing event
// is dropped with a warning instead of vanishing silently.
bool append_or_warn(EventLog& log, const LogEvent& ev);

} // namespace cwt
