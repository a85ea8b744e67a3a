#include <catch2/catch_test_macros.hpp>
#include <vector>

#include <cwt/live_copy.hpp>

using namespace cwt;

static LiveCopyEvent tx(char c, Millis start, Millis dur) { return TransmitEvent{c, start, dur}; }
static LiveCopyEvent ty(char c, Millis t) { return TypedEvent{c, t}; }

static const LiveCopyConfig kCfg{100.0, FeedbackMode::End};

TEST_CASE("a character with nothing typed goes pending, then missed") {
  const std::vector<LiveCopyEvent> log{tx('A', 0.0, 500.0)};

  auto at99 = evaluate_live_copy(log, 99.0, kCfg);
  REQUIRE(at99.display.empty());
  REQUIRE(at99.score.total == 0);
  REQUIRE(at99.score.accuracy == 0);

  auto at150 = evaluate_live_copy(log, 150.0, kCfg);
  REQUIRE(at150.display.size() == 1);
  REQUIRE(at150.display[0].ch == 'A');
  REQUIRE(at150.display[0].status == CharStatus::Pending);
  REQUIRE_FALSE(at150.display[0].typed.has_value());

  auto at700 = evaluate_live_copy(log, 700.0, kCfg);
  REQUIRE(at700.display[0].status == CharStatus::Missed);
  REQUIRE(at700.score.missed == 1);
  REQUIRE(at700.score.total == 1);
  REQUIRE(at700.score.accuracy == 0);
}

TEST_CASE("a wrong key in the window shows what was typed") {
  const std::vector<LiveCopyEvent> log{tx('A', 0.0, 500.0), ty('B', 150.0)};

  auto live = evaluate_live_copy(log, 300.0, kCfg);
  REQUIRE(live.display[0].status == CharStatus::Pending);
  REQUIRE(live.display[0].typed == 'B');

  auto done = evaluate_live_copy(log, 700.0, kCfg);
  REQUIRE(done.display[0].status == CharStatus::Wrong);
  REQUIRE(done.display[0].typed == 'B');
  REQUIRE(done.score.wrong == 1);
}

TEST_CASE("back-to-back characters copied correctly") {
  const std::vector<LiveCopyEvent> log{
    tx('A', 0.0, 500.0), tx('B', 500.0, 500.0), tx('C', 1000.0, 500.0),
    ty('A', 150.0), ty('b', 650.0), ty('C', 1150.0),
  };
  auto st = evaluate_live_copy(log, 1700.0, kCfg);
  REQUIRE(st.display.size() == 3);
  for (const auto& d : st.display) {
    REQUIRE(d.status == CharStatus::Correct);
    REQUIRE_FALSE(d.typed.has_value());
  }
  REQUIRE(st.score.correct == 3);
  REQUIRE(st.score.total == 3);
  REQUIRE(st.score.accuracy == 100);
  REQUIRE(st.current_position == 3);
}

TEST_CASE("window boundaries are half-open and the first key wins") {
  const std::vector<LiveCopyEvent> log{
    tx('A', 0.0, 500.0), tx('B', 500.0, 500.0),
    ty('X', 99.0),  // before A's window: ignored
    ty('A', 100.0), // window start is inclusive
    ty('Q', 200.0), // second key in A's window: ignored
    ty('B', 600.0), // A's window end is exclusive; this belongs to B
  };
  auto st = evaluate_live_copy(log, 2000.0, kCfg);
  REQUIRE(st.display[0].status == CharStatus::Correct);
  REQUIRE(st.display[1].status == CharStatus::Correct);
}

TEST_CASE("keys stamped after the evaluation time are ignored") {
  const std::vector<LiveCopyEvent> log{tx('A', 0.0, 500.0), ty('A', 400.0)};
  auto st = evaluate_live_copy(log, 300.0, kCfg);
  REQUIRE_FALSE(st.display[0].typed.has_value());
}

TEST_CASE("evaluation is monotone in time and idempotent") {
  const std::vector<LiveCopyEvent> log{
    tx('C', 0.0, 400.0), tx('Q', 400.0, 400.0), tx('D', 800.0, 400.0), tx('X', 1200.0, 400.0),
    ty('C', 250.0), ty('O', 600.0), ty('x', 1500.0), ty('Z', 1550.0),
  };

  std::vector<CharDisplay> prev;
  for (Millis t = 0.0; t <= 2000.0; t += 10.0) {
    const auto st = evaluate_live_copy(log, t, kCfg);
    REQUIRE(st == evaluate_live_copy(log, t, kCfg));
    REQUIRE(st.display.size() >= prev.size());
    for (std::size_t i = 0; i < prev.size(); ++i) {
      if (prev[i].status != CharStatus::Pending) {
        REQUIRE(st.display[i].status == prev[i].status);
        REQUIRE(st.display[i].typed == prev[i].typed);
      }
    }
    prev = st.display;
  }

  const auto last = evaluate_live_copy(log, 2000.0, kCfg);
  REQUIRE(last.display[0].status == CharStatus::Correct);
  REQUIRE(last.display[1].status == CharStatus::Wrong);
  REQUIRE(last.display[2].status == CharStatus::Missed);
  REQUIRE(last.display[3].status == CharStatus::Correct);
  REQUIRE(last.score.accuracy == 50);
}

TEST_CASE("feedback mode controls reveal") {
  const std::vector<LiveCopyEvent> log{tx('A', 0.0, 500.0), tx('B', 500.0, 500.0), ty('A', 150.0)};

  SECTION("end mode reveals nothing during the session") {
    auto st = evaluate_live_copy(log, 2000.0, kCfg);
    for (const auto& d : st.display) REQUIRE_FALSE(d.revealed);
  }

  SECTION("immediate mode reveals closed windows only") {
    auto st = evaluate_live_copy(log, 800.0, LiveCopyConfig{100.0, FeedbackMode::Immediate});
    REQUIRE(st.display[0].revealed);
    REQUIRE_FALSE(st.display[1].revealed);
  }
}

TEST_CASE("display cells hide correctness until revealed") {
  std::vector<CharDisplay> display{
    {'A', CharStatus::Correct, std::nullopt, false},
    {'B', CharStatus::Wrong, 'X', false},
    {'C', CharStatus::Missed, std::nullopt, false},
    {'D', CharStatus::Pending, 'D', false},
    {'E', CharStatus::Pending, std::nullopt, false},
  };

  auto hidden = to_display_cells(display);
  REQUIRE(cells_text(hidden) == "_X_D_");
  for (const auto& c : hidden) REQUIRE(c.status == CellStatus::Pending);

  for (auto& d : display) d.revealed = d.status != CharStatus::Pending;
  auto shown = to_display_cells(display);
  REQUIRE(cells_text(shown) == "ABCD_");
  REQUIRE(shown[0].status == CellStatus::Correct);
  REQUIRE(shown[1].status == CellStatus::Incorrect);
  REQUIRE(shown[2].status == CellStatus::Missed);
}

TEST_CASE("results view lines up the copy with the sent text") {
  const std::vector<CharDisplay> display{
    {'C', CharStatus::Correct, std::nullopt, true},
    {'Q', CharStatus::Wrong, 'O', true},
    {'D', CharStatus::Missed, std::nullopt, true},
  };
  const auto view = results_view(display);
  REQUIRE(cells_text(view.correct_text) == "CQD");
  REQUIRE(cells_text(view.user_copy) == "CO_");
  REQUIRE(view.user_copy[1].status == CellStatus::Incorrect);
  REQUIRE(view.correct_text[0].status == CellStatus::Neutral);
}

TEST_CASE("feedback modes parse") {
  REQUIRE(parse_feedback_mode("Immediate") == FeedbackMode::Immediate);
  REQUIRE(parse_feedback_mode("end") == FeedbackMode::End);
  REQUIRE_FALSE(parse_feedback_mode("later").has_value());
}
