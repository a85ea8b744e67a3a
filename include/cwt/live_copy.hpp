#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <cwt/clock.hpp>

namespace cwt {

// A character put on the air. duration covers the whole slot, trailing
// inter-character spacing included; it alone defines the window end.
struct TransmitEvent {
  char ch = '\0';
  Millis start_time = 0.0;
  Millis duration = 0.0;
};

struct TypedEvent {
  char ch = '\0';
  Millis time = 0.0;
};

using LiveCopyEvent = std::variant<TransmitEvent, TypedEvent>;

enum class CharStatus { Pending, Correct, Wrong, Missed };
enum class FeedbackMode { Immediate, End };

const char* to_string(CharStatus s);
const char* to_string(FeedbackMode m);
std::optional<FeedbackMode> parse_feedback_mode(const std::string& s);

struct LiveCopyConfig {
  Millis offset = 100.0;
  FeedbackMode feedback = FeedbackMode::End;
};

struct CharDisplay {
  char ch = '\0';
  CharStatus status = CharStatus::Pending;
  std::optional<char> typed; // live keystroke while pending, the wrong key once closed
  bool revealed = false;

  bool operator==(const CharDisplay&) const = default;
};

struct Score {
  int correct = 0;
  int wrong = 0;
  int missed = 0;
  int total = 0;    // non-pending characters
  int accuracy = 0; // round(100 * correct / total), 0 when total == 0

  bool operator==(const Score&) const = default;
};

struct LiveCopyState {
  std::vector<CharDisplay> display;
  Score score;
  int current_position = 0; // number of evaluated characters

  bool operator==(const LiveCopyState&) const = default;
};

// Pure: same (events, current_time, config) always yields the same state, and
// for a fixed log a character never leaves a terminal status as time grows.
LiveCopyState evaluate_live_copy(const std::vector<LiveCopyEvent>& events, Millis current_time,
                                 const LiveCopyConfig& config);

Score score_display(const std::vector<CharDisplay>& display);

// Presentation helpers for a character grid.
enum class CellStatus { Pending, Correct, Incorrect, Missed, Neutral };

struct DisplayCell {
  char text = '_';
  CellStatus status = CellStatus::Neutral;
};

// Live view: typed text or '_' until revealed, the correct character after.
std::vector<DisplayCell> to_display_cells(const std::vector<CharDisplay>& display);

struct ResultsView {
  std::vector<DisplayCell> user_copy;
  std::vector<DisplayCell> correct_text;
};

// End-of-session comparison of what was copied against what was sent.
ResultsView results_view(const std::vector<CharDisplay>& display);

std::string cells_text(const std::vector<DisplayCell>& cells);

} // namespace cwt
