#include <cwt/input_bus.hpp>
#include <algorithm>
#include <utility>

namespace cwt {

void InputBus::push(InputEvent ev) {
  const Millis at = ev.at;
  stream_.push_back(Entry{std::move(ev)});
  if (at > clock_.now()) {
    clock_.schedule_at(at, [this] { deliver_(); });
    return;
  }
  deliver_();
  clock_.executor().run_ready();
}

void InputBus::take_until(KeyPredicate pred, const CancelToken& tok, Completion<InputEvent> done) {
  if (tok.cancelled()) {
    done(std::nullopt);
    return;
  }
  auto w = std::make_shared<Waiter>();
  w->id = next_id_++;
  w->pred = std::move(pred);
  w->done = std::move(done);
  w->tok = tok;
  waiters_.push_back(w);

  std::weak_ptr<Waiter> weak = w;
  w->reg = tok.on_cancel([this, weak] {
    auto self = weak.lock();
    if (!self) return;
    auto it = std::find(waiters_.begin(), waiters_.end(), self);
    if (it == waiters_.end()) return; // already matched
    waiters_.erase(it);
    auto cb = std::move(self->done);
    cb(std::nullopt);
  });

  // Something already buffered may satisfy it.
  deliver_();
}

void InputBus::deliver_() {
  const Millis now = clock_.now();
  std::vector<InputEvent> announce;
  std::vector<std::pair<std::shared_ptr<Waiter>, InputEvent>> matched;

  for (auto& e : stream_) {
    if (e.ev.at > now) continue;
    if (!e.announced) {
      e.announced = true;
      announce.push_back(e.ev);
    }
    if (e.consumed) continue;
    for (auto it = waiters_.begin(); it != waiters_.end(); ++it) {
      if ((*it)->pred && (*it)->pred(e.ev)) {
        e.consumed = true;
        matched.emplace_back(*it, e.ev);
        waiters_.erase(it);
        break;
      }
    }
  }

  // Consumed entries are announced already and can never match again.
  stream_.erase(std::remove_if(stream_.begin(), stream_.end(),
                               [](const Entry& e) { return e.consumed; }),
                stream_.end());

  const auto observers = observers_;
  for (const auto& ev : announce) {
    for (const auto& o : observers) o.second(ev);
  }
  for (auto& m : matched) {
    m.first->tok.remove(m.first->reg);
    auto cb = std::move(m.first->done);
    cb(std::move(m.second));
  }
}

std::uint64_t InputBus::observe(std::function<void(const InputEvent&)> fn) {
  const std::uint64_t id = next_id_++;
  observers_.emplace_back(id, std::move(fn));
  return id;
}

void InputBus::unobserve(std::uint64_t id) {
  observers_.erase(std::remove_if(observers_.begin(), observers_.end(),
                                  [id](const auto& o) { return o.first == id; }),
                   observers_.end());
}

bool InputBus::undo_last() {
  for (auto it = stream_.rbegin(); it != stream_.rend(); ++it) {
    if (!it->consumed) {
      stream_.erase(std::next(it).base());
      return true;
    }
  }
  return false;
}

std::vector<InputEvent> InputBus::pending() const {
  const Millis now = clock_.now();
  std::vector<InputEvent> out;
  for (const auto& e : stream_) {
    if (!e.consumed && e.ev.at <= now) out.push_back(e.ev);
  }
  return out;
}

void InputBus::clear() {
  stream_.clear();
}

} // namespace cwt
