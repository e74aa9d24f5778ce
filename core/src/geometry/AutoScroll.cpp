#include "dt/geometry/AutoScroll.hpp"
#include "dt/geometry/TabStripGeometry.hpp"

#include <algorithm>

namespace dt {

double computeAutoScrollDelta(double x, double visibleLeft, double visibleRight,
                              const AutoScrollConfig& cfg) {
  if (cfg.edgeMarginPx <= 0.0 || visibleRight <= visibleLeft) return 0.0;

  double leftDepth = cfg.edgeMarginPx - (x - visibleLeft);
  if (leftDepth > 0.0) {
    return -std::min(cfg.maxStepPx, cfg.maxStepPx * leftDepth / cfg.edgeMarginPx);
  }

  double rightDepth = cfg.edgeMarginPx - (visibleRight - x);
  if (rightDepth > 0.0) {
    return std::min(cfg.maxStepPx, cfg.maxStepPx * rightDepth / cfg.edgeMarginPx);
  }
  return 0.0;
}

AutoScrollController::AutoScrollController(TimerQueue& timers,
                                           const TabStripLayoutSource* layout,
                                           ScrollTarget* target)
  : timers_(timers), layout_(layout), target_(target) {}

AutoScrollController::~AutoScrollController() { stop(); }

double AutoScrollController::update(double pointerX) {
  pointerX_ = pointerX;
  // Moves only re-aim the tick; stepping per event would scale with the
  // input rate.
  double delta = currentDelta();
  if (delta != 0.0) {
    scheduleTick();
  } else {
    stop();
  }
  return delta;
}

void AutoScrollController::stop() {
  if (tick_ != kNoTimer) {
    timers_.cancel(tick_);
    tick_ = kNoTimer;
  }
}

double AutoScrollController::currentDelta() const {
  if (!layout_ || !target_) return 0.0;

  StripLayout layout;
  if (!layout_->queryLayout(layout)) return 0.0;
  return computeAutoScrollDelta(pointerX_, layout.visibleLeft,
                                layout.visibleRight, config_);
}

double AutoScrollController::step() {
  double delta = currentDelta();
  if (delta == 0.0) return 0.0;

  double applied = target_->scrollBy(delta);
  if (applied != 0.0 && onScrolled_) onScrolled_();
  return applied;
}

void AutoScrollController::scheduleTick() {
  if (tick_ != kNoTimer) return;
  tick_ = timers_.schedule(config_.tickMs, [this]() {
    tick_ = kNoTimer;
    // Stops by itself at the scroll limit or once the pointer left the edge.
    if (step() != 0.0) scheduleTick();
  });
}

} // namespace dt
