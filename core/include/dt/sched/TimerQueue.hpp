#pragma once
#include <cstdint>
#include <functional>
#include <vector>

namespace dt {

using TimerId = std::uint64_t;

inline constexpr TimerId kNoTimer = 0;

// Cancellable one-shot tasks on a window's UI loop. Time only moves when the
// loop calls advanceTo()/advanceBy(), so tests drive it directly.
// Callbacks may schedule or cancel other tasks.
class TimerQueue {
public:
  TimerId schedule(std::int64_t delayMs, std::function<void()> fn);

  // Returns false if the task already ran or was cancelled.
  bool cancel(TimerId id);

  // Run every task due at or before nowMs, in due order. Returns the number
  // of callbacks run.
  std::size_t advanceTo(std::int64_t nowMs);
  std::size_t advanceBy(std::int64_t deltaMs) { return advanceTo(now_ + deltaMs); }

  std::int64_t now() const { return now_; }
  std::size_t pending() const { return tasks_.size(); }
  bool isScheduled(TimerId id) const;

private:
  struct Task {
    TimerId id{kNoTimer};
    std::int64_t dueMs{0};
    std::function<void()> fn;
  };

  std::vector<Task> tasks_;
  std::int64_t now_{0};
  TimerId nextId_{1};
};

} // namespace dt
