#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace cwt {

// Completion for operations that can be cancelled: std::nullopt means Cancelled.
template <class T>
using Completion = std::function<void(std::optional<T>)>;

namespace detail {

struct CancelState {
  bool cancelled = false;
  std::uint64_t next_id = 1;
  std::vector<std::pair<std::uint64_t, std::function<void()>>> callbacks;

  void cancel();
};

} // namespace detail

// Read side of a cancellation scope. Cheap to copy; a default token never fires.
class CancelToken {
public:
  CancelToken() = default;

  bool cancelled() const { return st_ && st_->cancelled; }
  bool can_cancel() const { return st_ != nullptr; }

  // Runs fn once on cancellation (immediately if already cancelled, in which
  // case 0 is returned). Registration ids are never 0.
  std::uint64_t on_cancel(std::function<void()> fn) const;
  void remove(std::uint64_t id) const;

private:
  friend class CancelSource;
  explicit CancelToken(std::shared_ptr<detail::CancelState> st) : st_(std::move(st)) {}
  std::shared_ptr<detail::CancelState> st_;
};

// Owner side. A child source is cancelled synchronously with its parent.
class CancelSource {
public:
  CancelSource();
  explicit CancelSource(const CancelToken& parent);
  ~CancelSource();
  CancelSource(const CancelSource&) = delete;
  CancelSource& operator=(const CancelSource&) = delete;

  void cancel(); // idempotent
  bool cancelled() const { return st_->cancelled; }
  CancelToken token() const { return CancelToken(st_); }

private:
  std::shared_ptr<detail::CancelState> st_;
  CancelToken parent_;
  std::uint64_t parent_reg_{0};
};

} // namespace cwt
