#include <raylib.h>
#include <cstddef>
#include <cstdio>
#include <string>

#include <cwt/viewer/app.hpp>
#include <cwt/alphabet.hpp>
#include <cwt/error.hpp>
#include <cwt/log.hpp>

namespace cwt {

namespace {

// --- layout (keep in sync with draw_hud_) ---
static constexpr int kHUD_LINE1_Y = 20;  // size 20
static constexpr int kHUD_LINE2_Y = 46;  // size 18
static constexpr int kHUD_LINE3_Y = 72;  // size 14
static constexpr int kBODY_Y      = 120;
static constexpr int kCELL_W      = 30;
static constexpr int kCELL_SIZE   = 28;
static constexpr std::size_t kRECENT_MAX = 12;
static constexpr int kBUTTON_W    = 200;
static constexpr int kBUTTON_H    = 64;
static constexpr int kBUTTON_GAP  = 24;

static const Color kText    {220, 225, 235, 255};
static const Color kDim     {140, 150, 165, 255};
static const Color kCorrect { 46, 204, 113, 255};
static const Color kWrong   {231,  76,  60, 255};
static const Color kMissed  {236, 112,  99, 255};

static Color cellColor(CellStatus s) {
  switch (s) {
    case CellStatus::Correct:   return kCorrect;
    case CellStatus::Incorrect: return kWrong;
    case CellStatus::Missed:    return kMissed;
    case CellStatus::Pending:   return kText;
    case CellStatus::Neutral:   return kDim;
  }
  return kText;
}

static Color verdictColor(const std::optional<Verdict>& v) {
  if (!v) return kText;
  switch (*v) {
    case Verdict::Correct:   return kCorrect;
    case Verdict::Incorrect: return kWrong;
    case Verdict::Timeout:   return kMissed;
  }
  return kText;
}

static void fmt_time(Millis ms, char* out, int cap) {
  if (cap <= 0 || out == nullptr) return;
  if (ms < 0.0) ms = 0.0;
  const int total_s = static_cast<int>(ms / 1000.0);
  std::snprintf(out, static_cast<size_t>(cap), "%d:%02d", total_s / 60, total_s % 60);
}

static void forward_to_tracelog(LogLevel level, const std::string& msg) {
  int rl = LOG_INFO;
  switch (level) {
    case LogLevel::Debug: rl = LOG_DEBUG; break;
    case LogLevel::Info:  rl = LOG_INFO; break;
    case LogLevel::Warn:  rl = LOG_WARNING; break;
    case LogLevel::Error: rl = LOG_ERROR; break;
  }
  TraceLog(rl, "CWT: %s", msg.c_str());
}

// Word buttons sit in one centred row below the word line.
static Rectangle word_button_rect(std::size_t i, std::size_t count, int y) {
  const int row_w = static_cast<int>(count) * kBUTTON_W + (static_cast<int>(count) - 1) * kBUTTON_GAP;
  const int x = (GetScreenWidth() - row_w) / 2 + static_cast<int>(i) * (kBUTTON_W + kBUTTON_GAP);
  return Rectangle{static_cast<float>(x), static_cast<float>(y), kBUTTON_W, kBUTTON_H};
}

static constexpr int kWORD_BUTTONS_Y = kBODY_Y + 80;

// Draws a row of cells, wrapping at the window edge. Returns the next free y.
static int draw_cells(const std::vector<DisplayCell>& cells, int x0, int y) {
  const int max_x = GetScreenWidth() - 20 - kCELL_W;
  int x = x0;
  for (const auto& c : cells) {
    const char txt[2] = {c.text, '\0'};
    DrawText(txt, x, y, kCELL_SIZE, cellColor(c.status));
    x += kCELL_W;
    if (x > max_x) { x = x0; y += kCELL_SIZE + 8; }
  }
  return y + kCELL_SIZE + 12;
}

} // namespace

void TrainerApp::CueFeedback::trigger(FeedbackKind k, char c) {
  kind = k;
  ch = c;
  at = clock_.now();
}

TrainerApp::TrainerApp(const TrainerConfig& cfg)
  : cfg_(cfg),
    input_(clock_),
    audio_(clock_, cfg.extra_word_spacing_dits),
    feedback_(clock_),
    source_(cfg.alphabet, cfg.seed),
    runner_(EmissionPorts{clock_, input_, audio_, feedback_, log_}, source_) {
  runner_.subscribe([this](const SessionSnapshot& s) { snap_ = s; });
}

int TrainerApp::run() {
  const int W = 1024, H = 640;
  InitWindow(W, H, "CW Trainer");
  SetTargetFPS(144);
  set_log_sink(forward_to_tracelog);

  start_session_();
  while (!WindowShouldClose()) {
    process_input_();
    pump_session_();
    render_frame_();
  }

  runner_.stop();
  set_log_sink(nullptr);
  CloseWindow();
  return 0;
}

void TrainerApp::start_session_() {
  summary_.reset();
  recent_.clear();
  live_ = LiveCopyState{};
  feedback_.kind.reset();
  feedback_.revealed.reset();
  try {
    if (!runner_.start(cfg_)) return;
  } catch (const MorseError& e) {
    log_error("cannot start session: %s", e.what());
    return;
  }
  log_cursor_ = log_.size() - 1; // show the sessionStart entry
  next_refresh_ = clock_.now();
}

void TrainerApp::process_input_() {
  // Settle whatever fell due since the last frame first, so a window that
  // closed before this key was read has already timed out.
  clock_.poll();

  if (cfg_.mode == SessionMode::WordPractice) {
    // Digits pick a button; so does a click.
    for (int c = GetCharPressed(); c > 0; c = GetCharPressed()) {
      if (c >= '1' && c <= '9') click_word_button_(static_cast<std::size_t>(c - '1'));
    }
    if (IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
      const Vector2 m = GetMousePosition();
      for (std::size_t i = 0; i < snap_.word.buttons.size(); ++i) {
        if (CheckCollisionPointRec(m, word_button_rect(i, snap_.word.buttons.size(),
                                                       kWORD_BUTTONS_Y))) {
          click_word_button_(i);
        }
      }
    }
  }

  // Typed characters go to the bus stamped with the current clock.
  for (int c = GetCharPressed(); c > 0; c = GetCharPressed()) {
    if (c >= 128) continue;
    const std::string key(1, to_upper_ascii(static_cast<char>(c)));
    if (!is_valid_key(key)) continue;
    input_.push(InputEvent{clock_.now(), key});
  }

  if (IsKeyPressed(KEY_BACKSPACE)) input_.undo_last();
  if (IsKeyPressed(KEY_TAB)) {
    if (runner_.paused()) runner_.resume();
    else runner_.pause();
  }
  if (IsKeyPressed(KEY_ENTER)) start_session_();
}

void TrainerApp::click_word_button_(std::size_t i) {
  const auto& w = snap_.word;
  if (w.playing || w.flash || i >= w.buttons.size()) return;
  input_.push(InputEvent{clock_.now(), w.buttons[i]});
}

void TrainerApp::pump_session_() {
  clock_.poll();

  std::vector<LogEvent> fresh;
  if (log_.read_since(log_cursor_, fresh)) {
    recent_.insert(recent_.end(), fresh.begin(), fresh.end());
    if (recent_.size() > kRECENT_MAX) {
      recent_.erase(recent_.begin(), recent_.end() - static_cast<std::ptrdiff_t>(kRECENT_MAX));
    }
  }

  const Millis now = clock_.now();
  if (cfg_.mode == SessionMode::LiveCopy && runner_.active() && now >= next_refresh_) {
    live_ = runner_.live_copy_state(now);
    next_refresh_ = now + cfg_.display_update_interval_ms;
  }

  if (snap_.phase == SessionPhase::Ended && !summary_) {
    summary_ = compute_session_stats(runner_.session_events(), cfg_.mode);
    if (cfg_.mode == SessionMode::LiveCopy) live_ = runner_.live_copy_summary();
  }
}

void TrainerApp::render_frame_() {
  BeginDrawing();
  ClearBackground(Color{24, 28, 36, 255});

  draw_hud_();
  int y = kBODY_Y;
  if (cfg_.mode == SessionMode::LiveCopy) draw_live_copy_(y);
  else if (cfg_.mode == SessionMode::WordPractice) draw_words_(y);
  else draw_history_(y);
  if (summary_) draw_summary_(GetScreenHeight() - 200);

  EndDrawing();
}

void TrainerApp::draw_history_(int y) {
  const int x0 = 20;
  const int max_x = GetScreenWidth() - 20 - kCELL_W;
  int x = x0;
  for (std::size_t i = 0; i < snap_.previous.size(); ++i) {
    const auto& h = snap_.previous[i];
    const char txt[2] = {h.ch, '\0'};
    DrawText(txt, x, y, kCELL_SIZE, verdictColor(h.verdict));
    x += kCELL_W;
    if (x > max_x) { x = x0; y += kCELL_SIZE + 8; }
  }
  y += kCELL_SIZE + 24;

  if (cfg_.mode == SessionMode::Listen && feedback_.revealed) {
    const char txt[2] = {*feedback_.revealed, '\0'};
    DrawText(txt, GetScreenWidth() / 2 - 20, y, 64, kText);
  } else if (feedback_.kind) {
    const Color col = *feedback_.kind == FeedbackKind::Correct   ? kCorrect
                    : *feedback_.kind == FeedbackKind::Incorrect ? kWrong
                                                                 : kMissed;
    DrawText(TextFormat("%s '%c'", to_string(*feedback_.kind), feedback_.ch), 20, y, 24, col);
  }

  int ly = y + 48;
  for (const auto& ev : recent_) {
    DrawText(format_event(ev).c_str(), 20, ly, 14, kDim);
    ly += 16;
  }
}

void TrainerApp::draw_live_copy_(int y) {
  if (summary_) {
    const auto view = results_view(live_.display);
    DrawText("Sent:", 20, y, 18, kDim);
    y = draw_cells(view.correct_text, 100, y);
    DrawText("Copy:", 20, y, 18, kDim);
    draw_cells(view.user_copy, 100, y);
    return;
  }
  draw_cells(to_display_cells(live_.display), 20, y);
}

void TrainerApp::draw_words_(int y) {
  const auto& w = snap_.word;
  if (w.current_word.empty()) return;
  if (w.playing) {
    DrawText("listening...", GetScreenWidth() / 2 - 60, y, 24, kDim);
    return;
  }

  const std::size_t n = w.buttons.size();
  for (std::size_t i = 0; i < n; ++i) {
    const Rectangle r = word_button_rect(i, n, kWORD_BUTTONS_Y);
    Color fill{48, 56, 72, 255};
    // During the flash the clicked button shows the verdict, the answer shows green.
    if (w.flash) {
      if (w.buttons[i] == w.current_word && *w.flash == Verdict::Correct) fill = kCorrect;
      else if (w.buttons[i] == w.clicked) fill = kWrong;
    }
    DrawRectangleRec(r, fill);
    DrawText(TextFormat("%zu", i + 1), static_cast<int>(r.x) + 8, static_cast<int>(r.y) + 6, 14, kDim);
    const int tw = MeasureText(w.buttons[i].c_str(), 28);
    DrawText(w.buttons[i].c_str(), static_cast<int>(r.x) + (kBUTTON_W - tw) / 2,
             static_cast<int>(r.y) + (kBUTTON_H - 28) / 2, 28, kText);
  }
  if (w.flash && *w.flash == Verdict::Timeout) {
    DrawText("too slow", GetScreenWidth() / 2 - 40, y, 24, kMissed);
  }
}

void TrainerApp::draw_summary_(int y) {
  const auto& s = *summary_;
  DrawText("Session complete - Enter: new session", 20, y, 20, kText);
  if (cfg_.mode == SessionMode::LiveCopy) {
    const auto& sc = live_.score;
    DrawText(TextFormat("copied %d/%d  wrong %d  missed %d  accuracy %d%%",
                        sc.correct, sc.total, sc.wrong, sc.missed, sc.accuracy),
             20, y + 30, 18, kText);
    return;
  }
  DrawText(TextFormat("correct %d  incorrect %d  timeout %d  accuracy %.0f%%",
                      s.correct, s.incorrect, s.timeout, s.accuracy),
           20, y + 30, 18, kText);
  DrawText(TextFormat("latency mean %.0f ms  median %.0f ms  achieved %d wpm",
                      s.mean_latency_ms, s.median_latency_ms, s.achieved_wpm),
           20, y + 56, 18, kText);
  int x = 20;
  for (const auto& [expected, row] : s.confusion) {
    for (const auto& [got, count] : row) {
      DrawText(TextFormat("%c->%c x%d", expected, got, count), x, y + 84, 16, kWrong);
      x += 100;
    }
  }
}

void TrainerApp::draw_hud_() {
  char remaining[16];
  fmt_time(snap_.remaining_ms, remaining, sizeof(remaining));

  DrawText(TextFormat("mode=%s  wpm=%.0f/%.0f  window=%s  %s  left=%s",
                      to_string(cfg_.mode), cfg_.wpm, cfg_.farnsworth_wpm,
                      to_string(cfg_.speed_tier), to_string(snap_.phase), remaining),
           20, kHUD_LINE1_Y, 20, kText);

  if (cfg_.mode == SessionMode::WordPractice) {
    DrawText(TextFormat("attempts %d  picked %d  (%.0f%%)", snap_.word.attempts,
                        snap_.word.successes, snap_.word.accuracy),
             20, kHUD_LINE2_Y, 18, kText);
  } else if (cfg_.mode == SessionMode::LiveCopy) {
    DrawText(TextFormat("position %d  score %d/%d (%d%%)", live_.current_position,
                        live_.score.correct, live_.score.total, live_.score.accuracy),
             20, kHUD_LINE2_Y, 18, kText);
  } else {
    DrawText(TextFormat("correct %d  incorrect %d  timeout %d  (%.0f%%)", snap_.stats.correct,
                        snap_.stats.incorrect, snap_.stats.timeout, snap_.stats.accuracy),
             20, kHUD_LINE2_Y, 18, kText);
  }

  DrawText("Type what you hear | Backspace: Undo | Tab: Pause/Resume | Enter: New session | Esc: Quit",
           20, kHUD_LINE3_Y, 14, kDim);
}

} // namespace cwt
