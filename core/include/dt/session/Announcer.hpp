#pragma once
#include "dt/sched/TimerQueue.hpp"

#include <string>

namespace dt {

// Live-region text for assistive technology. Each message replaces the
// previous one and clears itself after clearMs.
class Announcer {
public:
  explicit Announcer(TimerQueue& timers) : timers_(timers) {}
  ~Announcer() { timers_.cancel(clearTimer_); }

  Announcer(const Announcer&) = delete;
  Announcer& operator=(const Announcer&) = delete;

  void setClearDelay(int ms) { clearMs_ = ms; }

  void announce(const std::string& message) {
    message_ = message;
    timers_.cancel(clearTimer_);
    clearTimer_ = timers_.schedule(clearMs_, [this]() {
      clearTimer_ = kNoTimer;
      message_.clear();
    });
  }

  const std::string& message() const { return message_; }

private:
  TimerQueue& timers_;
  std::string message_;
  int clearMs_{1200};
  TimerId clearTimer_{kNoTimer};
};

} // namespace dt
