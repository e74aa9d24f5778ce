#include "dt/sched/TimerQueue.hpp"

#include <algorithm>
#include <utility>

namespace dt {

TimerId TimerQueue::schedule(std::int64_t delayMs, std::function<void()> fn) {
  Task t;
  t.id = nextId_++;
  t.dueMs = now_ + std::max<std::int64_t>(0, delayMs);
  t.fn = std::move(fn);
  tasks_.push_back(std::move(t));
  return tasks_.back().id;
}

bool TimerQueue::cancel(TimerId id) {
  if (id == kNoTimer) return false;
  auto it = std::find_if(tasks_.begin(), tasks_.end(),
                         [id](const Task& t) { return t.id == id; });
  if (it == tasks_.end()) return false;
  tasks_.erase(it);
  return true;
}

bool TimerQueue::isScheduled(TimerId id) const {
  return std::any_of(tasks_.begin(), tasks_.end(),
                     [id](const Task& t) { return t.id == id; });
}

std::size_t TimerQueue::advanceTo(std::int64_t nowMs) {
  std::size_t ran = 0;

  for (;;) {
    // Earliest due task; ties run in scheduling order.
    auto next = tasks_.end();
    for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
      if (it->dueMs > nowMs) continue;
      if (next == tasks_.end() || it->dueMs < next->dueMs ||
          (it->dueMs == next->dueMs && it->id < next->id)) {
        next = it;
      }
    }
    if (next == tasks_.end()) break;

    auto fn = std::move(next->fn);
    now_ = std::max(now_, next->dueMs);
    tasks_.erase(next);
    fn();
    ran++;
  }

  now_ = std::max(now_, nowMs);
  return ran;
}

} // namespace dt
