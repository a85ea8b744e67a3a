#include <cwt/cancel.hpp>
#include <algorithm>

namespace cwt {

namespace detail {

void CancelState::cancel() {
  if (cancelled) return;
  cancelled = true;
  // Pop one at a time: a callback may remove a later registration.
  while (!callbacks.empty()) {
    auto fn = std::move(callbacks.front().second);
    callbacks.erase(callbacks.begin());
    if (fn) fn();
  }
}

} // namespace detail

std::uint64_t CancelToken::on_cancel(std::function<void()> fn) const {
  if (!st_) return 0;
  if (st_->cancelled) {
    if (fn) fn();
    return 0;
  }
  const std::uint64_t id = st_->next_id++;
  st_->callbacks.emplace_back(id, std::move(fn));
  return id;
}

void CancelToken::remove(std::uint64_t id) const {
  if (!st_ || id == 0) return;
  auto& cbs = st_->callbacks;
  cbs.erase(std::remove_if(cbs.begin(), cbs.end(),
                           [id](const auto& e) { return e.first == id; }),
            cbs.end());
}

CancelSource::CancelSource() : st_(std::make_shared<detail::CancelState>()) {}

CancelSource::CancelSource(const CancelToken& parent)
  : st_(std::make_shared<detail::CancelState>()), parent_(parent) {
  std::weak_ptr<detail::CancelState> weak = st_;
  parent_reg_ = parent_.on_cancel([weak] {
    if (auto st = weak.lock()) st->cancel();
  });
}

CancelSource::~CancelSource() {
  parent_.remove(parent_reg_);
}

void CancelSource::cancel() {
  parent_.remove(parent_reg_);
  parent_reg_ = 0;
  st_->cancel();
}

} // namespace cwt
