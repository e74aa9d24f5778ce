#pragma once
#include "dt/gesture/PointerEvent.hpp"
#include "dt/host/WindowHost.hpp"
#include "dt/sched/TimerQueue.hpp"

#include <functional>

namespace dt {

struct DropProbeConfig {
  int debounceMs{60};
};

// Asks the host which window sits under the drag point. Probes cross a
// process boundary, so request() coalesces raw moves into at most one
// probe per debounce window, always using the latest point.
class DropTargetResolver {
public:
  using ResolvedCallback = std::function<void(const WindowLabel& target)>;

  DropTargetResolver(WindowHost& host, TimerQueue& timers, WindowLabel source);
  ~DropTargetResolver();

  DropTargetResolver(const DropTargetResolver&) = delete;
  DropTargetResolver& operator=(const DropTargetResolver&) = delete;

  void setConfig(const DropProbeConfig& cfg) { config_ = cfg; }
  void setOnResolved(ResolvedCallback cb) { onResolved_ = std::move(cb); }

  void request(const DragPoint& point);

  // Immediate probe at the release point. A failed probe is reported as-is.
  HostResult resolveNow(const DragPoint& point);

  void cancel();
  bool isProbeScheduled() const { return probe_ != kNoTimer; }

private:
  void runProbe();

  WindowHost& host_;
  TimerQueue& timers_;
  WindowLabel source_;
  DropProbeConfig config_;
  ResolvedCallback onResolved_;
  DragPoint latest_;
  TimerId probe_{kNoTimer};
};

} // namespace dt
