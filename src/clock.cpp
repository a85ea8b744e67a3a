#include <cwt/clock.hpp>
#include <algorithm>
#include <thread>
#include <vector>

namespace cwt {

void Executor::run_ready() {
  if (draining_ || hold_depth_ > 0) return;
  draining_ = true;
  while (!ready_.empty()) {
    auto fn = std::move(ready_.front());
    ready_.pop_front();
    if (fn) fn();
  }
  draining_ = false;
}

TimerId Clock::schedule_at(Millis deadline, std::function<void()> fn) {
  const std::uint64_t seq = next_seq_++;
  const Key key{deadline, seq};
  timers_.emplace(key, std::move(fn));
  index_.emplace(seq, key);
  return seq;
}

void Clock::cancel_timer(TimerId id) {
  auto it = index_.find(id);
  if (it == index_.end()) return;
  timers_.erase(it->second);
  index_.erase(it);
}

std::optional<Millis> Clock::next_deadline() const {
  if (timers_.empty()) return std::nullopt;
  return timers_.begin()->first.first;
}

namespace {

struct SleepOp {
  bool finished = false;
  TimerId timer = 0;
  CancelToken tok;
  std::uint64_t reg = 0;
  Completion<Millis> done;
};

} // namespace

void Clock::sleep(Millis ms, const CancelToken& tok, Completion<Millis> done) {
  if (tok.cancelled()) {
    done(std::nullopt);
    return;
  }
  auto op = std::make_shared<SleepOp>();
  op->done = std::move(done);
  op->tok = tok;
  op->timer = schedule(ms, [this, op] {
    if (op->finished) return;
    op->finished = true;
    op->tok.remove(op->reg);
    auto cb = std::move(op->done);
    cb(now());
  });
  op->reg = tok.on_cancel([this, op] {
    if (op->finished) return;
    op->finished = true;
    cancel_timer(op->timer);
    auto cb = std::move(op->done);
    cb(std::nullopt);
  });
}

void Clock::fire_due_(Millis limit) {
  exec_.hold();
  std::vector<TimerId> due;
  for (;;) {
    due.clear();
    for (const auto& t : timers_) {
      if (t.first.first > limit) break;
      due.push_back(t.first.second);
    }
    if (due.empty()) break;
    std::sort(due.begin(), due.end());
    for (const TimerId id : due) {
      auto idx = index_.find(id);
      if (idx == index_.end()) continue; // cancelled by an earlier callback
      auto it = timers_.find(idx->second);
      auto fn = std::move(it->second);
      timers_.erase(it);
      index_.erase(idx);
      if (fn) fn();
    }
  }
  exec_.release();
  exec_.run_ready();
}

void FakeClock::advance(Millis ms) {
  const Millis target = now_ + (ms > 0.0 ? ms : 0.0);
  executor().run_ready();
  now_ = target;
  fire_due_(target);
}

void FakeClock::set_time(Millis t) {
  if (t < now_) return;
  advance(t - now_);
}

bool FakeClock::step() {
  const auto next = next_deadline();
  if (!next) return false;
  advance(*next > now_ ? *next - now_ : 0.0);
  return true;
}

void FakeClock::run_for(Millis ms) {
  const Millis target = now_ + (ms > 0.0 ? ms : 0.0);
  for (auto next = next_deadline(); next && *next <= target; next = next_deadline()) {
    step();
  }
  advance(target - now_);
}

void FakeClock::run_until_idle(Millis limit) {
  while (now_ <= limit) {
    const auto next = next_deadline();
    if (!next || *next > limit) break;
    step();
  }
}

void SystemClock::poll() {
  fire_due_(now());
}

void SystemClock::wait_until_next(Millis max_wait) {
  Millis wait = max_wait;
  if (const auto next = next_deadline()) {
    const Millis until = *next - now();
    if (until < wait) wait = until;
  }
  if (wait <= 0.0) return;
  std::this_thread::sleep_for(std::chrono::duration<double, std::milli>(wait));
}

} // namespace cwt
