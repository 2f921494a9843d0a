#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <folly/Synchronized.h>
#include <mutex>
#include <optional>
#include <utility>

namespace ostmig {

// Unbounded FIFO queue guarded by its own mutex. Every operation holds the lock for that single
// operation only; `tryPop` never blocks, `popFor` is for consumers that may wait.
template <typename T>
class LockedQueue {
 public:
  LockedQueue() = default;
  LockedQueue(const LockedQueue &) = delete;
  LockedQueue &operator=(const LockedQueue &) = delete;

  template <typename U = T>
  void push(U &&item) {
    queue_.lock()->push_back(std::forward<U>(item));
    cond_.notify_one();
  }

  // Push and run `whileLocked` before the lock is released, so a consumer never observes the item
  // before the side effect is done.
  template <typename U, typename F>
  void push(U &&item, F &&whileLocked) {
    queue_.withLock([&](std::deque<T> &queue) {
      queue.push_back(std::forward<U>(item));
      whileLocked();
    });
    cond_.notify_one();
  }

  std::optional<T> tryPop() {
    auto queue = queue_.lock();
    return popLocked(*queue);
  }

  template <typename Rep, typename Period>
  std::optional<T> popFor(std::chrono::duration<Rep, Period> timeout) {
    auto queue = queue_.lock();
    cond_.wait_for(queue.as_lock(), timeout, [&] { return !queue->empty(); });
    return popLocked(*queue);
  }

  bool empty() const { return queue_.lock()->empty(); }
  size_t size() const { return queue_.lock()->size(); }

 private:
  static std::optional<T> popLocked(std::deque<T> &queue) {
    if (queue.empty()) {
      return std::nullopt;
    }
    auto item = std::move(queue.front());
    queue.pop_front();
    return item;
  }

  folly::Synchronized<std::deque<T>, std::mutex> queue_;
  // only for consumers blocked in popFor
  std::condition_variable cond_;
};

}  // namespace ostmig
