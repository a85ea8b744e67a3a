#include <cwt/emission.hpp>
#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <cwt/alphabet.hpp>
#include <cwt/log.hpp>
#include <cwt/select.hpp>

namespace cwt {

const char* to_string(Verdict v) {
  switch (v) {
    case Verdict::Correct:   return "correct";
    case Verdict::Incorrect: return "incorrect";
    case Verdict::Timeout:   return "timeout";
  }
  return "?";
}

namespace {

struct RaceHit {
  Verdict verdict = Verdict::Timeout;
  InputEvent key;
};

bool is_answer_key(const InputEvent& e) {
  return e.key.size() == 1 && is_morse_char(e.key[0]);
}

// Plays ch and continues even if the device failed.
void play_tolerant(AudioPort& audio, char ch, double wpm, std::function<void()> next) {
  audio.play_char(ch, wpm, [ch, next = std::move(next)](AudioResult r) {
    if (r == AudioResult::Failed) {
      log_warn("audio playback failed for '%c', continuing silently", ch);
    }
    next();
  });
}

Arm<RaceHit> key_arm(InputBus& input, KeyPredicate pred, Verdict verdict) {
  return Arm<RaceHit>{[&input, pred = std::move(pred), verdict](const CancelToken& tok,
                                                                 Completion<RaceHit> d) {
    input.take_until(pred, tok, [verdict, d](std::optional<InputEvent> ev) {
      if (!ev) { d(std::nullopt); return; }
      d(RaceHit{verdict, std::move(*ev)});
    });
  }};
}

void finish_practice(const EmissionPorts& io, const Emission& em, Millis race_start,
                     const RaceHit& hit, Completion<PracticeOutcome> done) {
  PracticeOutcome out;
  out.verdict = hit.verdict;
  out.expected = em.ch;
  out.emission = em;

  if (hit.verdict == Verdict::Timeout) {
    append_or_warn(io.log, LogEvent::timeout(io.clock.now(), em.ch));
    io.feedback.trigger(FeedbackKind::Timeout, em.ch);
    log_debug("emission %llu '%c': timeout at %.1f",
                  static_cast<unsigned long long>(em.id), em.ch, io.clock.now());
    done(out);
    return;
  }

  out.got = to_upper_ascii(hit.key.key[0]);
  if (hit.verdict == Verdict::Correct) {
    out.latency_ms = hit.key.at - race_start;
    append_or_warn(io.log, LogEvent::correct(hit.key.at, em.ch, out.latency_ms));
  } else {
    append_or_warn(io.log, LogEvent::incorrect(hit.key.at, em.ch, out.got));
  }
  log_debug("emission %llu '%c': %s ('%c', %.1f ms)",
                static_cast<unsigned long long>(em.id), em.ch, to_string(out.verdict),
                out.got, hit.key.at - race_start);

  // A key won: silence any tone still sounding before the cue.
  auto& feedback = io.feedback;
  io.audio.stop_audio([&feedback, out, done = std::move(done)] {
    feedback.trigger(out.verdict == Verdict::Correct ? FeedbackKind::Correct
                                                     : FeedbackKind::Incorrect,
                     out.expected);
    done(out);
  });
}

void race_practice(const EmissionPorts& io, const Emission& em, Millis window,
                   const CancelToken& session, Completion<PracticeOutcome> done) {
  const Millis race_start = io.clock.now();
  const char ch = em.ch;

  // Only keys stamped inside [race_start, race_start + window] answer this
  // character; a key at the closing instant still beats the timeout.
  const Millis race_end = race_start + window;
  auto in_window = [race_start, race_end](const InputEvent& e) {
    return e.at >= race_start && e.at <= race_end && is_answer_key(e);
  };
  auto matches = [ch, in_window](const InputEvent& e) {
    return in_window(e) && same_char_ci(e.key[0], ch);
  };
  auto other = [ch, in_window](const InputEvent& e) {
    return in_window(e) && !same_char_ci(e.key[0], ch);
  };

  std::vector<Arm<RaceHit>> arms;
  arms.push_back(key_arm(io.input, matches, Verdict::Correct));
  arms.push_back(key_arm(io.input, other, Verdict::Incorrect));
  arms.push_back(clock_timeout(io.clock, window, RaceHit{}));

  select<RaceHit>(io.clock.executor(), std::move(arms), session,
                  [io, em, race_start, done = std::move(done)](std::optional<Selected<RaceHit>> r) {
                    if (!r) {
                      log_debug("emission %llu '%c': cancelled",
                                    static_cast<unsigned long long>(em.id), em.ch);
                      done(std::nullopt);
                      return;
                    }
                    finish_practice(io, em, race_start, r->value, done);
                  });
}

// Plays word[i..] with the Farnsworth gap between letters; done(false) if
// the session was cancelled on the way.
void play_word_from(const EmissionPorts& io, const EmissionTiming& timing, std::string word,
                    std::size_t i, CancelToken session, std::function<void(bool)> done) {
  if (i >= word.size()) { done(true); return; }
  play_tolerant(io.audio, word[i], timing.wpm, [io, timing, word, i, session, done] {
    if (session.cancelled()) { done(false); return; }
    if (i + 1 == word.size()) { done(true); return; }
    const Millis gap = farnsworth_spacing_ms(timing.wpm, timing.farnsworth_wpm);
    io.clock.sleep(gap, session, [io, timing, word, i, session, done](std::optional<Millis> woke) {
      if (!woke) { done(false); return; }
      play_word_from(io, timing, word, i + 1, session, done);
    });
  });
}

void finish_word(const EmissionPorts& io, WordOutcome out, Completion<WordOutcome> done) {
  switch (out.verdict) {
    case Verdict::Correct:
      append_or_warn(io.log, LogEvent::word_correct(out.started_at + out.latency_ms, out.word,
                                                    out.latency_ms));
      break;
    case Verdict::Incorrect:
      append_or_warn(io.log, LogEvent::word_incorrect(out.started_at + out.latency_ms, out.word,
                                                      out.clicked));
      break;
    case Verdict::Timeout:
      append_or_warn(io.log, LogEvent::word_timeout(io.clock.now(), out.word));
      break;
  }
  log_debug("word %llu \"%s\": %s (%s)", static_cast<unsigned long long>(out.id),
            out.word.c_str(), to_string(out.verdict),
            out.clicked.empty() ? "no click" : out.clicked.c_str());
  done(std::move(out));
}

} // namespace

void run_practice_emission(const EmissionPorts& io, const EmissionTiming& timing, char ch,
                           std::uint64_t id, const CancelToken& session,
                           Completion<PracticeOutcome> done) {
  const Millis start = io.clock.now();

  if (ch == ' ') {
    const Millis silence = char_duration_ms(' ', timing.wpm);
    const Emission em{id, ' ', start, start + silence};
    append_or_warn(io.log, LogEvent::emission(start, ' '));
    io.clock.sleep(silence, session, [io, em, done = std::move(done)](std::optional<Millis> woke) {
      if (!woke) { done(std::nullopt); return; }
      append_or_warn(io.log, LogEvent::correct(*woke, ' ', 0.0));
      PracticeOutcome out;
      out.verdict = Verdict::Correct;
      out.expected = ' ';
      out.got = ' ';
      out.emission = em;
      done(out);
    });
    return;
  }

  const Millis window = effective_window_ms(timing.tier, timing.wpm);
  const Millis tone = char_duration_ms(ch, timing.wpm);
  const Emission em{id, ch, start, start + tone + window};
  log_debug("emission %llu '%c': start %.1f, tone %.1f ms, window %.1f ms (%s)",
                static_cast<unsigned long long>(id), ch, start, tone, window,
                to_string(timing.tier));

  append_or_warn(io.log, LogEvent::emission(start, ch));
  // Audio is not preemptible: an abort is observed once the tone is over.
  play_tolerant(io.audio, ch, timing.wpm,
                [io, em, window, session, done = std::move(done)]() mutable {
                  if (session.cancelled()) { done(std::nullopt); return; }
                  race_practice(io, em, window, session, std::move(done));
                });
}

void run_listen_emission(const EmissionPorts& io, const EmissionTiming& timing, char ch,
                         std::uint64_t id, const CancelToken& session,
                         Completion<Emission> done) {
  const ListenTiming gaps = listen_timing_ms(timing.wpm, timing.farnsworth_wpm);
  const Millis start = io.clock.now();
  const Emission em{id, ch, start,
                    start + char_duration_ms(ch, timing.wpm) + gaps.pre_reveal + gaps.post_reveal};

  io.feedback.hide();
  append_or_warn(io.log, LogEvent::emission(start, ch));
  play_tolerant(io.audio, ch, timing.wpm, [io, em, gaps, session, done = std::move(done)] {
    io.clock.sleep(gaps.pre_reveal, session,
                   [io, em, gaps, session, done](std::optional<Millis> woke) {
                     if (!woke) { done(std::nullopt); return; }
                     io.feedback.reveal(em.ch);
                     io.clock.sleep(gaps.post_reveal, session,
                                    [em, done](std::optional<Millis> again) {
                                      if (!again) { done(std::nullopt); return; }
                                      done(em);
                                    });
                   });
  });
}

void run_live_copy_emission(const EmissionPorts& io, const EmissionTiming& timing, char ch,
                            std::uint64_t id, const CancelToken& session,
                            Completion<Emission> done) {
  const Millis gap = farnsworth_spacing_ms(timing.wpm, timing.farnsworth_wpm);
  const Millis start = io.clock.now();
  const Emission em{id, ch, start, start + char_duration_ms(ch, timing.wpm) + gap};

  append_or_warn(io.log, LogEvent::emission(start, ch));
  play_tolerant(io.audio, ch, timing.wpm, [io, em, gap, session, done = std::move(done)] {
    io.clock.sleep(gap, session, [em, done](std::optional<Millis> woke) {
      if (!woke) { done(std::nullopt); return; }
      done(em);
    });
  });
}

void run_word_practice_emission(const EmissionPorts& io, const EmissionTiming& timing,
                                const WordEntry& entry, std::uint64_t id,
                                const CancelToken& session, std::function<void()> on_played,
                                Completion<WordOutcome> done) {
  // Throws before anything is logged if the speeds are unusable.
  (void)farnsworth_spacing_ms(timing.wpm, timing.farnsworth_wpm);

  const Millis start = io.clock.now();
  std::vector<std::string> candidates{entry.word};
  candidates.insert(candidates.end(), entry.distractors.begin(), entry.distractors.end());

  append_or_warn(io.log, LogEvent::word_emission(start, entry.word));
  log_debug("word %llu \"%s\": start %.1f, %zu buttons", static_cast<unsigned long long>(id),
            entry.word.c_str(), start, candidates.size());

  auto race = [io, id, start, word = entry.word, candidates = std::move(candidates), session,
               on_played = std::move(on_played), done = std::move(done)](bool played) {
    if (!played) { done(std::nullopt); return; }
    if (on_played) on_played();

    const Millis race_start = io.clock.now();
    const Millis race_end = race_start + kWordClickTimeoutMs;
    auto clicked_candidate = [candidates, race_start, race_end](const InputEvent& e) {
      return e.at >= race_start && e.at <= race_end &&
             std::find(candidates.begin(), candidates.end(), e.key) != candidates.end();
    };

    std::vector<Arm<InputEvent>> arms;
    arms.push_back(Arm<InputEvent>{[&input = io.input, clicked_candidate](
                                       const CancelToken& tok, Completion<InputEvent> d) {
      input.take_until(clicked_candidate, tok, std::move(d));
    }});
    arms.push_back(clock_timeout(io.clock, kWordClickTimeoutMs, InputEvent{}));

    select<InputEvent>(io.clock.executor(), std::move(arms), session,
                       [io, id, start, word, done](std::optional<Selected<InputEvent>> r) {
                         if (!r) { done(std::nullopt); return; }
                         WordOutcome out;
                         out.word = word;
                         out.started_at = start;
                         out.id = id;
                         if (r->index == 1) {
                           out.verdict = Verdict::Timeout;
                         } else {
                           out.clicked = r->value.key;
                           out.latency_ms = r->value.at - start;
                           out.verdict = out.clicked == word ? Verdict::Correct
                                                             : Verdict::Incorrect;
                         }
                         finish_word(io, std::move(out), done);
                       });
  };
  play_word_from(io, timing, entry.word, 0, session, std::move(race));
}

} // namespace cwt
