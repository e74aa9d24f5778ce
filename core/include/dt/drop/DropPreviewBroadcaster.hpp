#pragma once
#include "dt/bus/MessageBus.hpp"
#include "dt/host/WindowHost.hpp"
#include "dt/sched/TimerQueue.hpp"

namespace dt {

struct SpringLoadConfig {
  int dwellMs{420};
  bool enabled{true};
};

// Announces the current drag-out candidate to every window and
// spring-loads it: hovering one target for dwellMs brings it forward once.
class DropPreviewBroadcaster {
public:
  DropPreviewBroadcaster(MessageBus& bus, TimerQueue& timers, WindowHost& host,
                         WindowLabel source);
  ~DropPreviewBroadcaster();

  DropPreviewBroadcaster(const DropPreviewBroadcaster&) = delete;
  DropPreviewBroadcaster& operator=(const DropPreviewBroadcaster&) = delete;

  void setConfig(const SpringLoadConfig& cfg) { config_ = cfg; }

  // New probe result (empty = no window under the pointer).
  void update(const WindowLabel& target);

  // Gesture over: broadcast a null target and drop any pending focus.
  void clear();

  const WindowLabel& currentTarget() const { return current_; }
  const WindowLabel& springFocusedWindow() const { return springFocused_; }
  // True once spring-loading has raised a window since the last clear().
  bool raisedTarget() const { return raised_; }
  bool isDwellPending() const { return dwell_ != kNoTimer; }

private:
  void broadcast(const WindowLabel& target);
  void cancelDwell();

  MessageBus& bus_;
  TimerQueue& timers_;
  WindowHost& host_;
  WindowLabel source_;
  SpringLoadConfig config_;

  WindowLabel current_;
  WindowLabel dwellTarget_;
  WindowLabel springFocused_;
  TimerId dwell_{kNoTimer};
  bool raised_{false};
};

} // namespace dt
