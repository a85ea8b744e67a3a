#pragma once
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <cwt/cancel.hpp>
#include <cwt/clock.hpp>

namespace cwt {

struct InputEvent {
  Millis at = 0.0;  // when the key was pressed
  std::string key;  // "A", "7", " ", or a named key
};

using KeyPredicate = std::function<bool(const InputEvent&)>;

// Ordered, timestamped stream of key presses. Consumers only ever observe
// events with at <= clock.now(); a future event becomes visible when the
// clock reaches it, in the same tick as any timer due at that instant.
class InputBus {
public:
  explicit InputBus(Clock& clock) : clock_(clock) {}
  InputBus(const InputBus&) = delete;
  InputBus& operator=(const InputBus&) = delete;

  void push(InputEvent ev);

  // Completes with the first visible, unconsumed event matching pred, in
  // arrival order, and marks it consumed. std::nullopt on cancellation.
  void take_until(KeyPredicate pred, const CancelToken& tok, Completion<InputEvent> done);

  std::uint64_t observe(std::function<void(const InputEvent&)> fn);
  void unobserve(std::uint64_t id);

  // Backspace: drops the most recent unconsumed event.
  bool undo_last();

  std::vector<InputEvent> pending() const;
  std::size_t waiting() const { return waiters_.size(); }
  // Entries still held: unconsumed ones and those not yet visible.
  std::size_t buffered() const { return stream_.size(); }
  void clear();

private:
  struct Entry {
    InputEvent ev;
    bool consumed = false;
    bool announced = false;
  };
  struct Waiter {
    std::uint64_t id = 0;
    KeyPredicate pred;
    Completion<InputEvent> done;
    CancelToken tok;
    std::uint64_t reg = 0;
  };

  void deliver_();

  Clock& clock_;
  std::deque<Entry> stream_;
  std::vector<std::shared_ptr<Waiter>> waiters_;
  std::vector<std::pair<std::uint64_t, std::function<void(const InputEvent&)>>> observers_;
  std::uint64_t next_id_{1};
};

} // namespace cwt
