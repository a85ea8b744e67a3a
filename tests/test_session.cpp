#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include <string>
#include <vector>

#include <cwt/error.hpp>
#include <cwt/session.hpp>
#include <cwt/stats.hpp>

using Catch::Approx;
using namespace cwt;

namespace {

struct Rig {
  explicit Rig(const std::string& text) : source(text) {}

  FakeClock clock;
  InputBus bus{clock};
  ClockedAudio audio{clock};
  NullFeedback feedback;
  EventLog log;
  TextCharSource source;
  SessionRunner runner{EmissionPorts{clock, bus, audio, feedback, log}, source};

  std::vector<LogEventKind> kinds() const {
    std::vector<LogEventKind> out;
    for (const auto& e : runner.session_events()) out.push_back(e.kind);
    return out;
  }
};

} // namespace

TEST_CASE("practice session records outcomes, slots and history") {
  Rig rig("AB");
  TrainerConfig cfg;
  REQUIRE(rig.runner.start(cfg));
  REQUIRE(rig.runner.snapshot().phase == SessionPhase::Running);
  REQUIRE(rig.runner.snapshot().current_char == 'A');

  rig.bus.push({350.0, "A"});  // A: 300 ms tone, answered 50 ms later
  rig.clock.run_for(350.0);
  REQUIRE(rig.runner.snapshot().current_char == 'B');

  // B: 540 ms tone from 350, window closes at 1890, 180 ms gap after the miss.
  rig.clock.run_for(1890.0 - 350.0);
  REQUIRE(rig.runner.snapshot().previous.size() == 2);
  rig.clock.run_for(180.0);
  REQUIRE(rig.runner.snapshot().current_char == 'A');

  const auto& snap = rig.runner.snapshot();
  REQUIRE(snap.previous[0].verdict == Verdict::Correct);
  REQUIRE(snap.previous[1].verdict == Verdict::Timeout);
  REQUIRE(snap.stats.correct == 1);
  REQUIRE(snap.stats.timeout == 1);
  REQUIRE(snap.stats.accuracy == Approx(50.0));

  REQUIRE(snap.emissions.size() == 3);
  REQUIRE(snap.emissions[0].start_time == Approx(0.0));
  REQUIRE(snap.emissions[0].duration == Approx(300.0 + 180.0));
  REQUIRE(snap.emissions[1].start_time == Approx(350.0));
  REQUIRE(snap.emissions[1].duration == Approx(540.0 + 180.0));
  REQUIRE(snap.emissions[2].start_time == Approx(2070.0));

  // Stopping mid-tone: the tone finishes before the end is logged.
  rig.clock.run_for(30.0);
  rig.runner.stop();
  REQUIRE(rig.runner.active());
  rig.clock.run_for(300.0);
  REQUIRE(rig.runner.snapshot().phase == SessionPhase::Ended);
  REQUIRE(rig.runner.session_events().back().kind == LogEventKind::SessionEnd);
  REQUIRE(rig.runner.session_events().back().at == Approx(2370.0));

  const std::vector<LogEventKind> expected{
    LogEventKind::SessionStart,
    LogEventKind::Emission, LogEventKind::Correct,
    LogEventKind::Emission, LogEventKind::Timeout,
    LogEventKind::Emission,
    LogEventKind::SessionEnd,
  };
  REQUIRE(rig.kinds() == expected);

  const auto stats = compute_session_stats(rig.runner.session_events());
  REQUIRE(stats.has_value());
  REQUIRE(stats->correct == 1);
  REQUIRE(stats->timeout == 1);
}

TEST_CASE("session ends once its length is used up") {
  Rig rig("A");
  TrainerConfig cfg;
  cfg.length_ms = 1000.0;
  REQUIRE(rig.runner.start(cfg));

  rig.clock.run_until_idle(10000.0);
  REQUIRE(rig.runner.snapshot().phase == SessionPhase::Ended);
  // Timeout at 1300, then the 180 ms gap, then the length check.
  REQUIRE(rig.log.events().back().at == Approx(1480.0));
  REQUIRE(rig.runner.snapshot().remaining_ms == Approx(0.0));
  REQUIRE(rig.runner.snapshot().emissions.size() == 1);
}

TEST_CASE("pause takes effect between emissions and stops the session timer") {
  Rig rig("A");
  TrainerConfig cfg;
  REQUIRE(rig.runner.start(cfg));

  rig.clock.run_for(100.0);
  rig.runner.pause();
  REQUIRE(rig.runner.snapshot().phase == SessionPhase::Running); // still in the race

  rig.clock.run_for(1380.0); // timeout at 1300, gap until 1480
  REQUIRE(rig.runner.snapshot().phase == SessionPhase::Paused);
  REQUIRE(rig.runner.snapshot().emissions.size() == 1);

  rig.clock.run_for(5000.0);
  REQUIRE(rig.runner.snapshot().emissions.size() == 1);

  SECTION("resume continues where it left off") {
    rig.runner.resume();
    const auto& snap = rig.runner.snapshot();
    REQUIRE(snap.phase == SessionPhase::Running);
    REQUIRE(snap.emissions.size() == 2);
    REQUIRE(snap.emissions[1].start_time == Approx(6480.0));
    // Only the 100 ms before the pause counts.
    REQUIRE(snap.remaining_ms == Approx(60000.0 - 100.0));
  }

  SECTION("stop while paused ends immediately") {
    rig.runner.stop();
    REQUIRE(rig.runner.snapshot().phase == SessionPhase::Ended);
    REQUIRE(rig.log.events().back().kind == LogEventKind::SessionEnd);
    REQUIRE(rig.log.events().back().at == Approx(6480.0));
  }
}

TEST_CASE("replay after a miss adds the repeated tone before the gap") {
  Rig rig("E");
  TrainerConfig cfg;

  SECTION("without replay") {
    REQUIRE(rig.runner.start(cfg));
    rig.clock.run_for(1240.0); // 60 tone + 1000 window + 180 gap
    REQUIRE(rig.runner.snapshot().emissions.size() == 2);
    REQUIRE(rig.audio.plays() == 2);
  }

  SECTION("with replay") {
    cfg.replay = true;
    REQUIRE(rig.runner.start(cfg));
    rig.clock.run_for(1240.0);
    REQUIRE(rig.runner.snapshot().emissions.size() == 1);
    rig.clock.run_for(60.0);
    REQUIRE(rig.runner.snapshot().emissions.size() == 2);
    REQUIRE(rig.runner.snapshot().emissions[1].start_time == Approx(1300.0));
    REQUIRE(rig.audio.plays() == 3);
  }
}

TEST_CASE("listen session keeps history without verdicts") {
  Rig rig("E");
  TrainerConfig cfg;
  cfg.mode = SessionMode::Listen;
  REQUIRE(rig.runner.start(cfg));

  rig.clock.run_for(240.0); // 60 tone + 119 + 61
  const auto& snap = rig.runner.snapshot();
  REQUIRE(snap.previous.size() == 1);
  REQUIRE_FALSE(snap.previous[0].verdict.has_value());
  REQUIRE(snap.emissions.size() == 2);
  REQUIRE(snap.stats.correct == 0);
}

TEST_CASE("live copy session evaluates keystrokes against transmitted slots") {
  Rig rig("AB");
  TrainerConfig cfg;
  cfg.mode = SessionMode::LiveCopy;
  REQUIRE(rig.runner.start(cfg));

  // A: slot [0, 480); B: slot [480, 1200); then A again from 1200.
  rig.bus.push({200.0, "A"});
  rig.bus.push({700.0, "X"});
  rig.clock.run_for(1300.0);

  const auto live = rig.runner.live_copy_state(rig.clock.now());
  REQUIRE(live.display.size() == 3);
  REQUIRE(live.display[0].status == CharStatus::Correct);
  REQUIRE(live.display[1].status == CharStatus::Wrong);
  REQUIRE(live.display[1].typed == 'X');
  REQUIRE(live.display[2].status == CharStatus::Pending);
  REQUIRE_FALSE(live.display[0].revealed);

  SECTION("backspace takes back the newest keystroke") {
    REQUIRE(rig.bus.undo_last());
    const auto again = rig.runner.live_copy_state(rig.clock.now());
    REQUIRE(again.display[1].status == CharStatus::Missed);
  }

  SECTION("summary reveals everything after the session") {
    rig.runner.stop();
    rig.clock.run_for(200.0); // A's tone runs out
    REQUIRE(rig.runner.snapshot().phase == SessionPhase::Ended);

    const auto summary = rig.runner.live_copy_summary();
    REQUIRE(summary.display.size() == 3);
    REQUIRE(summary.display[2].status == CharStatus::Missed);
    for (const auto& d : summary.display) REQUIRE(d.revealed);
    REQUIRE(summary.score.correct == 1);
    REQUIRE(summary.score.total == 3);
    REQUIRE(summary.score.accuracy == 33);
  }
}

TEST_CASE("subscribers get the current snapshot and every update") {
  Rig rig("E");
  std::vector<SessionPhase> phases;
  const auto id = rig.runner.subscribe([&](const SessionSnapshot& s) { phases.push_back(s.phase); });
  REQUIRE(phases == std::vector<SessionPhase>{SessionPhase::Idle});

  TrainerConfig cfg;
  REQUIRE(rig.runner.start(cfg));
  REQUIRE(phases.size() > 1);
  REQUIRE(phases.back() == SessionPhase::Running);

  rig.runner.unsubscribe(id);
  const auto seen = phases.size();
  rig.clock.run_for(2000.0);
  REQUIRE(phases.size() == seen);
}

TEST_CASE("start rejects invalid settings") {
  Rig rig("E");
  TrainerConfig cfg;

  SECTION("speed errors throw") {
    cfg.wpm = 0.0;
    REQUIRE_THROWS_AS(rig.runner.start(cfg), MorseError);
    cfg.wpm = 10.0;
    cfg.farnsworth_wpm = 15.0;
    REQUIRE_THROWS_AS(rig.runner.start(cfg), MorseError);
  }

  SECTION("other problems return false") {
    cfg.length_ms = 0.0;
    REQUIRE_FALSE(rig.runner.start(cfg));
  }

  REQUIRE_FALSE(rig.runner.active());
  REQUIRE(rig.log.empty());
}

TEST_CASE("starting again closes the previous session") {
  Rig rig("E");
  TrainerConfig cfg;
  REQUIRE(rig.runner.start(cfg));
  rig.clock.run_for(10.0); // mid-tone
  REQUIRE(rig.runner.start(cfg));

  std::size_t starts = 0, ends = 0;
  for (const auto& e : rig.log.events()) {
    starts += e.kind == LogEventKind::SessionStart;
    ends += e.kind == LogEventKind::SessionEnd;
  }
  REQUIRE(starts == 2);
  REQUIRE(ends == 1);
  REQUIRE(rig.runner.session_events().front().kind == LogEventKind::SessionStart);
  REQUIRE(rig.runner.session_events().front().at == Approx(10.0));

  // The old tone finishing must not disturb the new session.
  rig.clock.run_for(60.0);
  REQUIRE(rig.runner.active());
}

TEST_CASE("resume before the loop parks withdraws the pause") {
  Rig rig("A");
  TrainerConfig cfg;
  REQUIRE(rig.runner.start(cfg));

  rig.clock.run_for(100.0);
  rig.runner.pause();
  REQUIRE(rig.runner.paused());
  rig.clock.run_for(100.0);
  rig.runner.resume();
  REQUIRE_FALSE(rig.runner.paused());

  rig.clock.run_for(1280.0); // timeout at 1300, next character at 1480
  const auto& snap = rig.runner.snapshot();
  REQUIRE(snap.phase == SessionPhase::Running);
  REQUIRE(snap.emissions.size() == 2);
  REQUIRE(snap.remaining_ms == Approx(60000.0 - 1480.0));
}

TEST_CASE("word practice session replays a missed word until it is picked") {
  Rig rig("");
  TrainerConfig cfg;
  cfg.mode = SessionMode::WordPractice;
  cfg.words = {"AT"};
  REQUIRE(rig.runner.start(cfg));

  const auto& w = rig.runner.snapshot().word;
  REQUIRE(w.current_word == "AT");
  REQUIRE(w.playing);
  REQUIRE(w.buttons.size() == 3);
  REQUIRE(std::count(w.buttons.begin(), w.buttons.end(), std::string("AT")) == 1);

  rig.clock.run_for(660.0);
  REQUIRE_FALSE(w.playing);

  const std::string wrong = w.buttons[0] == "AT" ? w.buttons[1] : w.buttons[0];
  rig.bus.push({700.0, wrong});
  rig.clock.run_for(100.0);
  REQUIRE(w.flash == Verdict::Incorrect);
  REQUIRE(w.clicked == wrong);
  REQUIRE(w.attempts == 1);
  REQUIRE(rig.runner.snapshot().stats.incorrect == 1);

  rig.clock.run_for(400.0); // 500 ms flash, then the same word again
  REQUIRE_FALSE(w.flash.has_value());
  REQUIRE(w.current_word == "AT");
  REQUIRE(w.playing);

  rig.clock.run_for(660.0);
  rig.bus.push({1900.0, "AT"});
  rig.clock.run_for(100.0);
  REQUIRE(w.flash == Verdict::Correct);
  REQUIRE(w.attempts == 2);
  REQUIRE(w.successes == 1);
  REQUIRE(w.accuracy == Approx(50.0));

  rig.runner.stop();
  rig.clock.run_for(1000.0);
  REQUIRE(rig.runner.snapshot().phase == SessionPhase::Ended);

  const auto events = rig.runner.session_events();
  std::vector<Millis> emissions;
  for (const auto& e : events) {
    if (e.kind == LogEventKind::Emission) emissions.push_back(e.at);
  }
  REQUIRE(emissions == std::vector<Millis>{0.0, 1200.0});

  const auto stats = compute_session_stats(events, SessionMode::WordPractice);
  REQUIRE(stats.has_value());
  REQUIRE(stats->correct == 1);
  REQUIRE(stats->incorrect == 1);
  REQUIRE(stats->per_char.empty());
  REQUIRE(stats->achieved_wpm == 0);
}
