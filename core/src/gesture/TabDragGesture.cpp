#include "dt/gesture/TabDragGesture.hpp"
#include "dt/geometry/TabStripGeometry.hpp"

#include <cmath>
#include <cstdio>

namespace dt {

const char* dragModeName(DragMode mode) {
  switch (mode) {
    case DragMode::Idle:    return "idle";
    case DragMode::Hold:    return "hold";
    case DragMode::Pending: return "pending";
    case DragMode::Reorder: return "reorder";
    case DragMode::DragOut: return "dragout";
  }
  return "unknown";
}

TabDragGesture::~TabDragGesture() {
  if (holdTimer_ != kNoTimer) timers_.cancel(holdTimer_);
  // No callbacks from here: the owner is already being torn down.
  if (captured_ && capture_ && !capture_->release(pointerId_)) {
    std::fprintf(stderr,
                 "[TabDragGesture] pointer capture release failed for pointer %d\n",
                 pointerId_);
  }
}

bool TabDragGesture::onPointerDown(const TabId& tabId, bool pinned,
                                   const PointerEvent& ev) {
  // One gesture per window: a second contact waits for the first to end.
  if (view_.mode != DragMode::Idle) return false;
  if (pinned || ev.button != 0 || tabId.empty()) return false;

  pointerId_ = ev.pointerId;
  anchorX_ = ev.clientX;
  anchorY_ = ev.clientY;
  view_.draggedTabId = tabId;
  view_.dropIndex = -1;
  view_.livePoint = toDragPoint(ev);
  view_.hasLivePoint = true;

  captured_ = capture_ && capture_->acquire(ev.pointerId);
  if (capture_ && !captured_) {
    std::fprintf(stderr,
                 "[TabDragGesture] pointer capture unavailable for pointer %d, "
                 "tracking window-wide\n", ev.pointerId);
  }

  if (ev.kind == PointerKind::Mouse) {
    setMode(DragMode::Pending);
  } else {
    setMode(DragMode::Hold);
    holdTimer_ = timers_.schedule(config_.holdDelayMs,
                                  [this]() { onHoldElapsed(); });
  }
  return true;
}

void TabDragGesture::onHoldElapsed() {
  holdTimer_ = kNoTimer;
  if (view_.mode == DragMode::Hold) setMode(DragMode::Pending);
}

void TabDragGesture::onPointerMove(const PointerEvent& ev) {
  if (view_.mode == DragMode::Idle || ev.pointerId != pointerId_) return;

  view_.livePoint = toDragPoint(ev);
  const double dx = ev.clientX - anchorX_;

  switch (view_.mode) {
    case DragMode::Hold: {
      double dy = ev.clientY - anchorY_;
      if (std::hypot(dx, dy) > config_.holdCancelRadiusPx) {
        // Moved before the dwell elapsed: this was a tap or a scroll.
        reset();
      }
      return;
    }

    case DragMode::Pending: {
      StripLayout layout;
      if (!layout_ || !layout_->queryLayout(layout)) return;

      if (isOutsideVerticalBand(layout.barTop, layout.barBottom, ev.clientY,
                                config_.dragOutMarginPx)) {
        setMode(DragMode::DragOut);
      } else if (std::fabs(dx) > config_.reorderLockPx) {
        int idx = calcDropIndex(layout.tabs, ev.clientX);
        if (idx < 0) return;  // nothing measurable yet, stay pending
        view_.dropIndex = idx;
        setMode(DragMode::Reorder);
      } else {
        return;
      }
      break;
    }

    case DragMode::Reorder: {
      StripLayout layout;
      if (!layout_ || !layout_->queryLayout(layout)) return;  // keep last index

      int idx = calcDropIndex(layout.tabs, ev.clientX);
      if (idx >= 0) view_.dropIndex = idx;

      if (isOutsideVerticalBand(layout.barTop, layout.barBottom, ev.clientY,
                                config_.dragOutMarginPx)) {
        view_.dropIndex = -1;
        setMode(DragMode::DragOut);
      }
      break;
    }

    case DragMode::DragOut:
    case DragMode::Idle:
    default:
      break;
  }

  if (onDragMove_ && (view_.mode == DragMode::Reorder ||
                      view_.mode == DragMode::DragOut)) {
    onDragMove_(view_.mode, view_.livePoint);
  }
}

void TabDragGesture::onPointerUp(const PointerEvent& ev) {
  if (view_.mode == DragMode::Idle || ev.pointerId != pointerId_) return;

  view_.livePoint = toDragPoint(ev);
  const TabId tabId = view_.draggedTabId;
  const DragPoint point = view_.livePoint;
  const int dropIndex = view_.dropIndex;

  if (view_.mode == DragMode::DragOut) {
    if (onDragOut_) onDragOut_(tabId, point);
  } else if (view_.mode == DragMode::Reorder && dropIndex >= 0) {
    if (onReorder_) onReorder_(tabId, dropIndex);
  }
  reset();
}

void TabDragGesture::onPointerCancel(const PointerEvent& ev) {
  if (view_.mode == DragMode::Idle || ev.pointerId != pointerId_) return;
  reset();
}

void TabDragGesture::cancel() {
  if (view_.mode == DragMode::Idle) return;
  reset();
}

void TabDragGesture::refreshDropIndex() {
  if (view_.mode != DragMode::Reorder || !view_.hasLivePoint || !layout_) return;

  StripLayout layout;
  if (!layout_->queryLayout(layout)) return;
  int idx = calcDropIndex(layout.tabs, view_.livePoint.clientX);
  if (idx >= 0) view_.dropIndex = idx;
}

void TabDragGesture::setMode(DragMode mode) {
  if (view_.mode == mode) return;
  view_.mode = mode;
  if (onModeChanged_) onModeChanged_(mode);
}

void TabDragGesture::reset() {
  if (holdTimer_ != kNoTimer) {
    timers_.cancel(holdTimer_);
    holdTimer_ = kNoTimer;
  }

  if (captured_ && capture_) {
    // The window may be tearing down; a failed release is not an error.
    if (!capture_->release(pointerId_)) {
      std::fprintf(stderr,
                   "[TabDragGesture] pointer capture release failed for pointer %d\n",
                   pointerId_);
    }
  }
  captured_ = false;

  view_.draggedTabId.clear();
  view_.dropIndex = -1;
  view_.hasLivePoint = false;
  pointerId_ = 0;
  setMode(DragMode::Idle);
}

} // namespace dt
