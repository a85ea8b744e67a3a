#include <cwt/live_copy.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cwt/alphabet.hpp>

namespace cwt {

const char* to_string(CharStatus s) {
  switch (s) {
    case CharStatus::Pending: return "pending";
    case CharStatus::Correct: return "correct";
    case CharStatus::Wrong:   return "wrong";
    case CharStatus::Missed:  return "missed";
  }
  return "?";
}

const char* to_string(FeedbackMode m) {
  return m == FeedbackMode::Immediate ? "immediate" : "end";
}

std::optional<FeedbackMode> parse_feedback_mode(const std::string& s) {
  std::string v = s;
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (v == "immediate") return FeedbackMode::Immediate;
  if (v == "end")       return FeedbackMode::End;
  return std::nullopt;
}

LiveCopyState evaluate_live_copy(const std::vector<LiveCopyEvent>& events, Millis current_time,
                                 const LiveCopyConfig& config) {
  std::vector<const TypedEvent*> typed;
  for (const auto& e : events) {
    if (const auto* t = std::get_if<TypedEvent>(&e)) {
      if (t->time <= current_time) typed.push_back(t);
    }
  }

  LiveCopyState state;
  for (const auto& e : events) {
    const auto* tx = std::get_if<TransmitEvent>(&e);
    if (!tx) continue;

    const Millis window_start = tx->start_time + config.offset;
    const Millis window_end = tx->start_time + tx->duration + config.offset;
    // Windows that have not opened yet are not shown at all.
    if (window_start > current_time) continue;

    // First keystroke in the window wins.
    const TypedEvent* first = nullptr;
    for (const auto* t : typed) {
      if (t->time >= window_start && t->time < window_end) { first = t; break; }
    }

    CharDisplay cd;
    cd.ch = tx->ch;
    if (current_time < window_end) {
      cd.status = CharStatus::Pending;
      if (first) cd.typed = first->ch;
    } else if (first) {
      if (same_char_ci(first->ch, tx->ch)) {
        cd.status = CharStatus::Correct;
      } else {
        cd.status = CharStatus::Wrong;
        cd.typed = first->ch;
      }
    } else {
      cd.status = CharStatus::Missed;
    }

    cd.revealed = config.feedback == FeedbackMode::Immediate && cd.status != CharStatus::Pending;
    state.display.push_back(cd);
  }

  state.score = score_display(state.display);
  state.current_position = state.score.total;
  return state;
}

Score score_display(const std::vector<CharDisplay>& display) {
  Score s;
  for (const auto& d : display) {
    switch (d.status) {
      case CharStatus::Correct: ++s.correct; break;
      case CharStatus::Wrong:   ++s.wrong; break;
      case CharStatus::Missed:  ++s.missed; break;
      case CharStatus::Pending: continue;
    }
    ++s.total;
  }
  if (s.total > 0) {
    s.accuracy = static_cast<int>(std::lround(100.0 * s.correct / s.total));
  }
  return s;
}

std::vector<DisplayCell> to_display_cells(const std::vector<CharDisplay>& display) {
  std::vector<DisplayCell> cells;
  cells.reserve(display.size());
  for (const auto& d : display) {
    DisplayCell c;
    if (d.revealed) {
      c.text = d.ch;
      switch (d.status) {
        case CharStatus::Correct: c.status = CellStatus::Correct; break;
        case CharStatus::Wrong:   c.status = CellStatus::Incorrect; break;
        case CharStatus::Missed:  c.status = CellStatus::Missed; break;
        case CharStatus::Pending: c.status = CellStatus::Pending; break;
      }
    } else {
      // Unrevealed characters only ever show what the learner typed.
      c.text = d.typed ? *d.typed : '_';
      c.status = CellStatus::Pending;
    }
    cells.push_back(c);
  }
  return cells;
}

ResultsView results_view(const std::vector<CharDisplay>& display) {
  ResultsView view;
  view.user_copy.reserve(display.size());
  view.correct_text.reserve(display.size());
  for (const auto& d : display) {
    DisplayCell user;
    switch (d.status) {
      case CharStatus::Correct:
        user = {d.ch, CellStatus::Correct};
        break;
      case CharStatus::Wrong:
        user = {d.typed.value_or('_'), CellStatus::Incorrect};
        break;
      case CharStatus::Missed:
        user = {'_', CellStatus::Missed};
        break;
      case CharStatus::Pending:
        user = {d.typed.value_or('_'), CellStatus::Pending};
        break;
    }
    view.user_copy.push_back(user);
    view.correct_text.push_back({d.ch, CellStatus::Neutral});
  }
  return view;
}

std::string cells_text(const std::vector<DisplayCell>& cells) {
  std::string out;
  out.reserve(cells.size());
  for (const auto& c : cells) out.push_back(c.text);
  return out;
}

} // namespace cwt
