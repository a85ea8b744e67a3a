#include <cwt/session.hpp>
#include <algorithm>
#include <cwt/log.hpp>
#include <cwt/timing.hpp>

namespace cwt {

namespace {
constexpr Millis kWordFlashMs = 500.0;
}

const char* to_string(SessionPhase p) {
  switch (p) {
    case SessionPhase::Idle:    return "idle";
    case SessionPhase::Running: return "running";
    case SessionPhase::Paused:  return "paused";
    case SessionPhase::Ended:   return "ended";
  }
  return "?";
}

SessionRunner::SessionRunner(const EmissionPorts& io, CharSource& source)
  : io_(io), source_(source) {}

SessionRunner::~SessionRunner() {
  // Late completions must not reach a destroyed runner.
  ++generation_;
  if (abort_) abort_->cancel();
}

bool SessionRunner::start(const TrainerConfig& cfg) {
  // Speed errors are precondition violations; let them surface.
  (void)dit_ms(cfg.wpm);
  (void)farnsworth_spacing_ms(cfg.wpm, cfg.farnsworth_wpm);

  const auto problems = validate_config(cfg);
  if (!problems.empty()) {
    for (const auto& p : problems) log_error("cannot start session: %s", p.c_str());
    return false;
  }

  if (active()) {
    stop();
    // A tone still in flight would log the end later; close it out now.
    if (active()) end_();
  }

  ++generation_;
  cfg_ = cfg;
  timing_ = EmissionTiming{cfg.wpm, cfg.farnsworth_wpm, cfg.speed_tier};
  abort_ = std::make_unique<CancelSource>();
  paused_ = false;
  parked_ = false;
  paused_at_ = 0.0;
  total_paused_ms_ = 0.0;

  const Millis now = io_.clock.now();
  snapshot_ = SessionSnapshot{};
  snapshot_.phase = SessionPhase::Running;
  snapshot_.started_at = now;
  snapshot_.remaining_ms = cfg.length_ms;

  io_.input.clear();
  source_.reset();
  words_.reset();
  word_entry_.reset();
  if (cfg.mode == SessionMode::WordPractice) {
    words_.emplace(cfg.words, cfg.seed);
    button_rng_.seed(cfg.seed);
  }
  log_begin_ = io_.log.size();
  append_or_warn(io_.log, LogEvent::session_start(now));
  log_info("session start: %s, %.0f wpm (farnsworth %.0f), %s window, %.0f ms",
               to_string(cfg.mode), cfg.wpm, cfg.farnsworth_wpm, to_string(cfg.speed_tier),
               cfg.length_ms);
  publish_();

  step_();
  return true;
}

void SessionRunner::stop() {
  if (!active()) return;
  const bool parked = parked_;
  paused_ = false;
  parked_ = false;
  abort_->cancel();
  // Nothing is in flight while parked, so nobody else will end the session.
  if (parked) end_();
}

void SessionRunner::pause() {
  if (paused_ || snapshot_.phase != SessionPhase::Running) return;
  paused_ = true;
  paused_at_ = io_.clock.now();
  log_debug("session paused at %.1f", paused_at_);
}

void SessionRunner::resume() {
  if (!paused_) return;
  paused_ = false;
  // Withdrawn before the loop parked: the session never stopped.
  if (!parked_) return;
  const Millis paused_for = io_.clock.now() - paused_at_;
  total_paused_ms_ += paused_for;
  log_debug("session resumed after %.1f ms (total %.1f ms)", paused_for, total_paused_ms_);
  parked_ = false;
  snapshot_.phase = SessionPhase::Running;
  publish_();
  step_();
}

std::uint64_t SessionRunner::subscribe(SnapshotFn fn) {
  const std::uint64_t id = next_sub_id_++;
  fn(snapshot_);
  subscribers_.emplace_back(id, std::move(fn));
  return id;
}

void SessionRunner::unsubscribe(std::uint64_t id) {
  subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                    [id](const auto& s) { return s.first == id; }),
                     subscribers_.end());
}

void SessionRunner::publish_() {
  const auto subs = subscribers_;
  for (const auto& s : subs) s.second(snapshot_);
}

bool SessionRunner::time_left_() {
  update_remaining_();
  return snapshot_.remaining_ms > 0.0;
}

void SessionRunner::update_remaining_() {
  const Millis elapsed = io_.clock.now() - snapshot_.started_at - total_paused_ms_;
  snapshot_.remaining_ms = std::max(0.0, cfg_.length_ms - elapsed);
}

void SessionRunner::step_() {
  if (!abort_ || abort_->cancelled()) { end_(); return; }
  if (paused_) {
    parked_ = true;
    snapshot_.phase = SessionPhase::Paused;
    publish_();
    return;
  }
  if (!time_left_()) { end_(); return; }
  if (cfg_.mode == SessionMode::WordPractice) {
    step_word_();
    return;
  }

  const char ch = source_.next();
  prepare_(ch);

  const std::uint64_t gen = generation_;
  const std::uint64_t id = next_emission_id_++;
  const CancelToken tok = abort_->token();

  switch (cfg_.mode) {
    case SessionMode::Practice:
      run_practice_emission(io_, timing_, ch, id, tok,
                            [this, gen](std::optional<PracticeOutcome> out) {
                              if (gen != generation_) return;
                              if (!out) { end_(); return; }
                              after_practice_(*out);
                            });
      break;
    case SessionMode::Listen:
      run_listen_emission(io_, timing_, ch, id, tok,
                          [this, gen, ch](std::optional<Emission> em) {
                            if (gen != generation_) return;
                            if (!em) { end_(); return; }
                            after_emission_(ch, std::nullopt);
                            step_();
                          });
      break;
    case SessionMode::LiveCopy:
      run_live_copy_emission(io_, timing_, ch, id, tok,
                             [this, gen](std::optional<Emission> em) {
                               if (gen != generation_) return;
                               if (!em) { end_(); return; }
                               snapshot_.current_char.reset();
                               update_remaining_();
                               publish_();
                               step_();
                             });
      break;
    case SessionMode::WordPractice:
      break;
  }
}

void SessionRunner::prepare_(char ch) {
  snapshot_.current_char = ch;
  const Millis spacing = cfg_.mode == SessionMode::LiveCopy
                           ? farnsworth_spacing_ms(cfg_.wpm, cfg_.farnsworth_wpm)
                           : inter_character_spacing_ms(cfg_.wpm);
  snapshot_.emissions.push_back(TransmitEvent{
      ch, io_.clock.now(), char_duration_ms(ch, cfg_.wpm, cfg_.extra_word_spacing_dits) + spacing});
  publish_();
}

void SessionRunner::after_emission_(char ch, std::optional<Verdict> verdict) {
  snapshot_.previous.push_back(HistoryItem{ch, verdict});
  snapshot_.current_char.reset();
  update_remaining_();
  publish_();
}

void SessionRunner::count_outcome_(Verdict v) {
  auto& st = snapshot_.stats;
  switch (v) {
    case Verdict::Correct:   ++st.correct; break;
    case Verdict::Incorrect: ++st.incorrect; break;
    case Verdict::Timeout:   ++st.timeout; break;
  }
  const int total = st.correct + st.incorrect + st.timeout;
  st.accuracy = total > 0 ? 100.0 * st.correct / total : 0.0;
}

void SessionRunner::after_practice_(const PracticeOutcome& out) {
  count_outcome_(out.verdict);
  after_emission_(out.expected, out.verdict);

  if (out.verdict == Verdict::Correct) {
    step_();
    return;
  }

  // A miss is followed by an optional replay, then a character gap.
  const Millis gap = inter_character_spacing_ms(cfg_.wpm);
  if (cfg_.replay) {
    const std::uint64_t gen = generation_;
    log_debug("replaying '%c' after %s", out.expected, to_string(out.verdict));
    io_.audio.play_char(out.expected, cfg_.wpm, [this, gen, gap](AudioResult r) {
      if (gen != generation_) return;
      if (r == AudioResult::Failed) log_warn("audio playback failed during replay");
      sleep_then_step_(gap);
    });
    return;
  }
  sleep_then_step_(gap);
}

void SessionRunner::step_word_() {
  if (!word_entry_) word_entry_ = words_->next();

  auto& w = snapshot_.word;
  w.current_word = word_entry_->word;
  w.buttons.assign(1, word_entry_->word);
  w.buttons.insert(w.buttons.end(), word_entry_->distractors.begin(),
                   word_entry_->distractors.end());
  std::shuffle(w.buttons.begin(), w.buttons.end(), button_rng_);
  w.playing = true;
  w.flash.reset();
  w.clicked.clear();
  publish_();

  const std::uint64_t gen = generation_;
  const std::uint64_t id = next_emission_id_++;
  run_word_practice_emission(
      io_, timing_, *word_entry_, id, abort_->token(),
      [this, gen] {
        if (gen != generation_) return;
        snapshot_.word.playing = false;
        publish_();
      },
      [this, gen](std::optional<WordOutcome> out) {
        if (gen != generation_) return;
        if (!out) { end_(); return; }
        after_word_(*out);
      });
}

void SessionRunner::after_word_(const WordOutcome& out) {
  count_outcome_(out.verdict);
  auto& w = snapshot_.word;
  ++w.attempts;
  if (out.verdict == Verdict::Correct) ++w.successes;
  w.accuracy = 100.0 * w.successes / w.attempts;
  w.flash = out.verdict;
  w.clicked = out.clicked;
  const bool done_with_word = out.verdict == Verdict::Correct;
  if (done_with_word) word_entry_.reset();
  update_remaining_();
  publish_();

  const std::uint64_t gen = generation_;
  io_.clock.sleep(kWordFlashMs, abort_->token(),
                  [this, gen, done_with_word](std::optional<Millis> woke) {
                    if (gen != generation_) return;
                    if (!woke) { end_(); return; }
                    auto& ws = snapshot_.word;
                    ws.flash.reset();
                    ws.clicked.clear();
                    if (done_with_word) {
                      ws.current_word.clear();
                      ws.buttons.clear();
                    }
                    publish_();
                    step_();
                  });
}

void SessionRunner::sleep_then_step_(Millis ms) {
  const std::uint64_t gen = generation_;
  io_.clock.sleep(ms, abort_->token(), [this, gen](std::optional<Millis> woke) {
    if (gen != generation_) return;
    if (!woke) { end_(); return; }
    step_();
  });
}

void SessionRunner::end_() {
  if (snapshot_.phase == SessionPhase::Ended || snapshot_.phase == SessionPhase::Idle) return;
  const Millis now = io_.clock.now();
  parked_ = false;
  paused_ = false;
  append_or_warn(io_.log, LogEvent::session_end(now));
  update_remaining_();
  snapshot_.phase = SessionPhase::Ended;
  snapshot_.current_char.reset();
  snapshot_.word.playing = false;
  log_info("session end: %zu characters, %d correct, %d incorrect, %d timeout",
               snapshot_.emissions.size(), snapshot_.stats.correct, snapshot_.stats.incorrect,
               snapshot_.stats.timeout);
  publish_();
}

std::vector<LogEvent> SessionRunner::session_events() const {
  const auto& all = io_.log.events();
  if (log_begin_ >= all.size()) return {};
  return std::vector<LogEvent>(all.begin() + static_cast<std::ptrdiff_t>(log_begin_), all.end());
}

std::vector<LiveCopyEvent> SessionRunner::live_copy_events_(Millis now) const {
  std::vector<LiveCopyEvent> events;
  events.reserve(snapshot_.emissions.size());
  for (const auto& tx : snapshot_.emissions) events.emplace_back(tx);
  for (const auto& key : io_.input.pending()) {
    if (key.key.size() != 1 || key.at < snapshot_.started_at || key.at > now) continue;
    events.emplace_back(TypedEvent{key.key[0], key.at});
  }
  return events;
}

LiveCopyState SessionRunner::live_copy_state(Millis now) const {
  return evaluate_live_copy(live_copy_events_(now),
                            now, LiveCopyConfig{cfg_.live_copy_offset_ms, cfg_.feedback});
}

LiveCopyState SessionRunner::live_copy_summary() const {
  Millis until = io_.clock.now();
  for (const auto& tx : snapshot_.emissions) {
    until = std::max(until, tx.start_time + tx.duration + cfg_.live_copy_offset_ms);
  }
  return evaluate_live_copy(live_copy_events_(until), until,
                            LiveCopyConfig{cfg_.live_copy_offset_ms, FeedbackMode::Immediate});
}

} // namespace cwt
