#include "dt/drop/DropPreviewBroadcaster.hpp"
#include "dt/drop/DropPreview.hpp"

#include <cstdio>
#include <utility>

namespace dt {

DropPreviewBroadcaster::DropPreviewBroadcaster(MessageBus& bus, TimerQueue& timers,
                                               WindowHost& host, WindowLabel source)
  : bus_(bus), timers_(timers), host_(host), source_(std::move(source)) {}

DropPreviewBroadcaster::~DropPreviewBroadcaster() { cancelDwell(); }

void DropPreviewBroadcaster::update(const WindowLabel& target) {
  current_ = target;
  broadcast(target);

  if (target.empty()) {
    cancelDwell();
    springFocused_.clear();
    return;
  }
  if (!config_.enabled) return;
  if (springFocused_ == target) return;   // already brought forward
  if (dwellTarget_ == target && dwell_ != kNoTimer) return;  // still dwelling

  cancelDwell();
  dwellTarget_ = target;
  dwell_ = timers_.schedule(config_.dwellMs, [this]() {
    dwell_ = kNoTimer;
    WindowLabel target = dwellTarget_;
    dwellTarget_.clear();
    if (target != current_) return;

    springFocused_ = target;
    raised_ = true;
    HostResult r = host_.focusWindow(target);
    if (!r.ok) {
      std::fprintf(stderr,
                   "[DropPreviewBroadcaster] %s: spring-load focus of '%s' failed: %s\n",
                   source_.c_str(), target.c_str(), r.err.message.c_str());
    }
  });
}

void DropPreviewBroadcaster::clear() {
  current_.clear();
  broadcast({});
  cancelDwell();
  springFocused_.clear();
  raised_ = false;
}

void DropPreviewBroadcaster::broadcast(const WindowLabel& target) {
  bus_.broadcast(kDropPreviewEvent, encodeDropPreview({source_, target}));
}

void DropPreviewBroadcaster::cancelDwell() {
  if (dwell_ != kNoTimer) {
    timers_.cancel(dwell_);
    dwell_ = kNoTimer;
  }
  dwellTarget_.clear();
}

} // namespace dt
