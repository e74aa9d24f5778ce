#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

namespace dt {

// Bounded multi-producer mailbox drained by one consumer thread. When full,
// the oldest message is dropped: drop-preview traffic is superseded by each
// newer message anyway.
template <typename T>
class Mailbox {
public:
  explicit Mailbox(std::size_t maxCapacity = 1024)
      : maxCap_(maxCapacity) {}

  // Returns false if an older message had to be dropped to make room.
  bool push(T item) {
    std::lock_guard<std::mutex> lock(mtx_);
    bool dropped = false;
    if (queue_.size() >= maxCap_) {
      queue_.pop_front();
      dropped_++;
      dropped = true;
    }
    queue_.push_back(std::move(item));
    return !dropped;
  }

  // Moves everything queued so far into out (appending). Returns the count.
  std::size_t drainTo(std::vector<T>& out) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::size_t n = queue_.size();
    for (auto& item : queue_) out.push_back(std::move(item));
    queue_.clear();
    return n;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return queue_.size();
  }

  std::size_t droppedCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return dropped_;
  }

private:
  mutable std::mutex mtx_;
  std::deque<T> queue_;
  std::size_t maxCap_;
  std::size_t dropped_{0};
};

} // namespace dt
