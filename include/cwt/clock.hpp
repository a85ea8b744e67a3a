#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>
#include <cwt/cancel.hpp>

namespace cwt {

using Millis = double;
using TimerId = std::uint64_t;

// Single cooperative ready queue. Everything runs on the host thread.
class Executor {
public:
  void post(std::function<void()> fn) { ready_.push_back(std::move(fn)); }

  // Drains the queue, including work posted while draining. No-op when called
  // re-entrantly or while a timer batch is being fired.
  void run_ready();

  bool idle() const { return ready_.empty(); }

  // While held, run_ready() defers; everything settled in the meantime
  // belongs to the same scheduling tick.
  void hold() { ++hold_depth_; }
  void release() { if (hold_depth_ > 0) --hold_depth_; }

private:
  std::deque<std::function<void()>> ready_;
  int hold_depth_{0};
  bool draining_{false};
};

// Source of monotonic time and timers. All suspension goes through here so
// host time and simulated time are interchangeable.
class Clock {
public:
  virtual ~Clock() = default;

  virtual Millis now() const = 0;

  TimerId schedule_at(Millis deadline, std::function<void()> fn);
  TimerId schedule(Millis delay, std::function<void()> fn) {
    return schedule_at(now() + (delay > 0.0 ? delay : 0.0), std::move(fn));
  }
  void cancel_timer(TimerId id);
  std::size_t pending_timers() const { return timers_.size(); }
  std::optional<Millis> next_deadline() const;

  // Completes with now() after ms, or std::nullopt if tok fires first.
  void sleep(Millis ms, const CancelToken& tok, Completion<Millis> done);

  Executor& executor() { return exec_; }

protected:
  // Fires every timer due at or before limit as a single tick, strictly in
  // registration order. Timers added meanwhile that are already due join it.
  void fire_due_(Millis limit);

private:
  using Key = std::pair<Millis, std::uint64_t>; // (deadline, registration seq)
  std::map<Key, std::function<void()>> timers_;
  std::unordered_map<TimerId, Key> index_;
  std::uint64_t next_seq_{1};
  Executor exec_;
};

// Deterministic, manually advanced clock.
class FakeClock : public Clock {
public:
  explicit FakeClock(Millis start = 0.0) : now_(start) {}

  Millis now() const override { return now_; }

  // Moves now() to now() + ms, then fires every due timer in the order it
  // was registered, regardless of deadline.
  void advance(Millis ms);
  void set_time(Millis t); // forward only; earlier times are ignored
  // Advances to the next deadline if there is one. Returns false when idle.
  bool step();
  // Walks deadline by deadline up to now() + ms, so chained sleeps see the
  // time they were due at.
  void run_for(Millis ms);
  // Steps until no timers remain or limit is reached.
  void run_until_idle(Millis limit);

private:
  Millis now_;
};

// Wall-clock implementation for an interactive host loop.
class SystemClock : public Clock {
public:
  SystemClock() : epoch_(std::chrono::steady_clock::now()) {}

  Millis now() const override {
    using namespace std::chrono;
    return duration<double, std::milli>(steady_clock::now() - epoch_).count();
  }

  // Fires everything due as one tick, then drains ready work.
  void poll();
  // Sleeps until the next deadline, capped at max_wait.
  void wait_until_next(Millis max_wait);

private:
  std::chrono::steady_clock::time_point epoch_;
};

} // namespace cwt
