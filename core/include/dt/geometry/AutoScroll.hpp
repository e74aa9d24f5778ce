#pragma once
#include "dt/sched/TimerQueue.hpp"

#include <functional>

namespace dt {

class TabStripLayoutSource;
class ScrollTarget;

struct AutoScrollConfig {
  double edgeMarginPx{28.0};
  double maxStepPx{14.0};
  int tickMs{16};
};

// Scroll step for a pointer at x. Grows linearly with the depth into either
// edge margin and is capped at maxStepPx; zero inside the safe centre band.
double computeAutoScrollDelta(double x, double visibleLeft, double visibleRight,
                              const AutoScrollConfig& cfg);

// Keeps nudging the strip while a reordering pointer rests near an edge.
class AutoScrollController {
public:
  AutoScrollController(TimerQueue& timers, const TabStripLayoutSource* layout,
                       ScrollTarget* target);
  ~AutoScrollController();

  AutoScrollController(const AutoScrollController&) = delete;
  AutoScrollController& operator=(const AutoScrollController&) = delete;

  void setConfig(const AutoScrollConfig& cfg) { config_ = cfg; }
  void setOnScrolled(std::function<void()> cb) { onScrolled_ = std::move(cb); }

  // Feed the live pointer x. Keeps a repeating tick alive while x stays in
  // an edge zone; each tick scrolls at most maxStepPx. Returns the delta the
  // next tick will apply (0 = stopped).
  double update(double pointerX);

  void stop();
  bool isTicking() const { return tick_ != kNoTimer; }

private:
  double currentDelta() const;
  double step();
  void scheduleTick();

  TimerQueue& timers_;
  const TabStripLayoutSource* layout_;
  ScrollTarget* target_;
  AutoScrollConfig config_;
  std::function<void()> onScrolled_;
  double pointerX_{0};
  TimerId tick_{kNoTimer};
};

} // namespace dt
