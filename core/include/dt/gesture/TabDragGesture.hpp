#pragma once
#include "dt/gesture/PointerEvent.hpp"
#include "dt/ids/Id.hpp"
#include "dt/sched/TimerQueue.hpp"

#include <cstdint>
#include <functional>

namespace dt {

class TabStripLayoutSource;

struct GestureConfig {
  int holdDelayMs{180};            // touch/pen dwell before a drag may start
  double holdCancelRadiusPx{8.0};  // movement that turns a hold into a tap
  double dragOutMarginPx{40.0};    // distance outside the bar band to detach
  double reorderLockPx{6.0};       // horizontal travel that locks reorder
};

// States: Idle -> (Hold ->) Pending -> Reorder -> DragOut -> Idle
//                           Pending -----------> DragOut
enum class DragMode : std::uint8_t {
  Idle = 0,
  Hold,
  Pending,
  Reorder,
  DragOut
};

const char* dragModeName(DragMode mode);

// What the rendering layer needs for ghosts and drop indicators.
struct DragView {
  DragMode mode{DragMode::Idle};
  TabId draggedTabId;
  int dropIndex{-1};  // -1 = none
  DragPoint livePoint;
  bool hasLivePoint{false};
};

class TabDragGesture {
public:
  using ReorderCallback = std::function<void(const TabId& tabId, int dropIndex)>;
  using DragOutCallback = std::function<void(const TabId& tabId, const DragPoint& point)>;
  using MoveCallback = std::function<void(DragMode mode, const DragPoint& point)>;
  using ModeCallback = std::function<void(DragMode mode)>;

  explicit TabDragGesture(TimerQueue& timers) : timers_(timers) {}
  ~TabDragGesture();

  TabDragGesture(const TabDragGesture&) = delete;
  TabDragGesture& operator=(const TabDragGesture&) = delete;

  void setConfig(const GestureConfig& cfg) { config_ = cfg; }
  void setLayoutSource(const TabStripLayoutSource* layout) { layout_ = layout; }
  void setPointerCapture(PointerCapture* capture) { capture_ = capture; }

  void setOnReorder(ReorderCallback cb) { onReorder_ = std::move(cb); }
  void setOnDragOut(DragOutCallback cb) { onDragOut_ = std::move(cb); }
  void setOnDragMove(MoveCallback cb) { onDragMove_ = std::move(cb); }
  void setOnModeChanged(ModeCallback cb) { onModeChanged_ = std::move(cb); }

  // Returns true if tracking started. Ignored while another gesture is in
  // flight, for pinned tabs, and for non-primary buttons.
  bool onPointerDown(const TabId& tabId, bool pinned, const PointerEvent& ev);
  void onPointerMove(const PointerEvent& ev);
  void onPointerUp(const PointerEvent& ev);
  void onPointerCancel(const PointerEvent& ev);

  // Abort without committing (focus loss, window hidden).
  void cancel();

  // Re-run the hit-test at the last live point (after the strip scrolled).
  void refreshDropIndex();

  DragMode mode() const { return view_.mode; }
  bool isActive() const { return view_.mode != DragMode::Idle; }
  const DragView& view() const { return view_; }

private:
  void setMode(DragMode mode);
  void onHoldElapsed();
  void reset();

  TimerQueue& timers_;
  GestureConfig config_;
  const TabStripLayoutSource* layout_{nullptr};
  PointerCapture* capture_{nullptr};

  ReorderCallback onReorder_;
  DragOutCallback onDragOut_;
  MoveCallback onDragMove_;
  ModeCallback onModeChanged_;

  DragView view_;
  std::int32_t pointerId_{0};
  double anchorX_{0}, anchorY_{0};
  bool captured_{false};
  TimerId holdTimer_{kNoTimer};
};

} // namespace dt
