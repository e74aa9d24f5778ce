#include "dt/drop/DropTargetResolver.hpp"

#include <cstdio>
#include <utility>

namespace dt {

DropTargetResolver::DropTargetResolver(WindowHost& host, TimerQueue& timers,
                                       WindowLabel source)
  : host_(host), timers_(timers), source_(std::move(source)) {}

DropTargetResolver::~DropTargetResolver() { cancel(); }

void DropTargetResolver::request(const DragPoint& point) {
  latest_ = point;
  if (probe_ != kNoTimer) return;
  probe_ = timers_.schedule(config_.debounceMs, [this]() { runProbe(); });
}

HostResult DropTargetResolver::resolveNow(const DragPoint& point) {
  return host_.findWindowUnderPoint(point.screenX, point.screenY, source_);
}

void DropTargetResolver::cancel() {
  if (probe_ != kNoTimer) {
    timers_.cancel(probe_);
    probe_ = kNoTimer;
  }
}

void DropTargetResolver::runProbe() {
  probe_ = kNoTimer;

  HostResult r = resolveNow(latest_);
  if (!r.ok) {
    std::fprintf(stderr, "[DropTargetResolver] %s: probe failed: %s (%s)\n",
                 source_.c_str(), r.err.code.c_str(), r.err.message.c_str());
    r.window.clear();
  }
  if (onResolved_) onResolved_(r.window);
}

} // namespace dt
