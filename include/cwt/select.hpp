#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>
#include <cwt/cancel.hpp>
#include <cwt/clock.hpp>

namespace cwt {

// One competitor in a race. run must eventually call done exactly once:
// with a value when it settles, std::nullopt once its token is cancelled.
template <class T>
struct Arm {
  std::function<void(const CancelToken&, Completion<T>)> run;
};

template <class T>
struct Selected {
  std::size_t index = 0;
  T value;
};

// Runs every arm concurrently and completes with the first to settle. Arms
// settling in the same scheduling tick resolve to the lowest index. Losing
// arms are cancelled, and have run their cleanup, before done is invoked.
// done receives std::nullopt when outer fires first (abort wins over a
// same-tick settle) or when every arm dropped out without a value.
template <class T>
void select(Executor& ex, std::vector<Arm<T>> arms, const CancelToken& outer,
            Completion<Selected<T>> done) {
  struct State {
    explicit State(const CancelToken& parent) : arms_src(parent) {}
    CancelSource arms_src;
    CancelToken outer;
    std::uint64_t outer_reg = 0;
    std::vector<std::optional<T>> ready;
    std::size_t remaining = 0;
    bool finalize_posted = false;
    bool settled = false;
    Completion<Selected<T>> done;
  };

  if (arms.empty() || outer.cancelled()) {
    done(std::nullopt);
    return;
  }

  auto st = std::make_shared<State>(outer);
  st->outer = outer;
  st->ready.resize(arms.size());
  st->remaining = arms.size();
  st->done = std::move(done);

  auto finalize = [st] {
    if (st->settled) return;
    st->settled = true;
    st->outer.remove(st->outer_reg);

    std::optional<Selected<T>> winner;
    if (!st->outer.cancelled()) {
      for (std::size_t i = 0; i < st->ready.size(); ++i) {
        if (st->ready[i]) {
          winner = Selected<T>{i, std::move(*st->ready[i])};
          break;
        }
      }
    }
    // Losers unwind here, before the caller sees the result.
    st->arms_src.cancel();
    auto cb = std::move(st->done);
    cb(std::move(winner));
  };

  auto request_finalize = [st, &ex, finalize] {
    if (st->finalize_posted) return;
    st->finalize_posted = true;
    ex.post(finalize);
    ex.run_ready();
  };

  st->outer_reg = outer.on_cancel([request_finalize] { request_finalize(); });

  // Arms that settle while starting belong to the same tick.
  ex.hold();
  const CancelToken arm_tok = st->arms_src.token();
  for (std::size_t i = 0; i < arms.size(); ++i) {
    arms[i].run(arm_tok, [st, i, request_finalize](std::optional<T> v) {
      if (st->settled) return;
      if (st->remaining > 0) --st->remaining;
      if (v) st->ready[i] = std::move(v);
      if (st->ready[i] || st->remaining == 0) request_finalize();
    });
  }
  ex.release();
  ex.run_ready();
}

// Arm that settles with value after ms on clock.
template <class T>
Arm<T> clock_timeout(Clock& clock, Millis ms, T value) {
  return Arm<T>{[&clock, ms, value](const CancelToken& tok, Completion<T> done) {
    clock.sleep(ms, tok, [value, done](std::optional<Millis> woke) {
      if (woke) done(value);
      else done(std::nullopt);
    });
  }};
}

} // namespace cwt
