#include "dt/session/WindowDragCoordinator.hpp"
#include "dt/reorder/ReorderRules.hpp"
#include "dt/tabs/TabStore.hpp"

#include <algorithm>
#include <utility>

namespace dt {

WindowDragCoordinator::WindowDragCoordinator(WindowLabel label, bool primary,
                                             TabStore& tabs, DocumentStore& docs,
                                             WindowHost& host, MessageBus& bus,
                                             TimerQueue& timers,
                                             const TabStripLayoutSource* layout,
                                             ScrollTarget* scroll)
  : label_(std::move(label)), primary_(primary), tabs_(tabs),
    timers_(timers),
    announcer_(timers),
    gesture_(timers),
    autoScroll_(timers, layout, scroll),
    resolver_(host, timers, label_),
    broadcaster_(bus, timers, host, label_),
    previewListener_(bus, label_),
    transfer_(label_, primary, tabs, docs, host, resolver_, history_) {
  gesture_.setLayoutSource(layout);
  gesture_.setOnReorder([this](const TabId& id, int dropIndex) {
    commitReorder(id, dropIndex);
  });
  gesture_.setOnDragOut([this](const TabId& id, const DragPoint& point) {
    commitDragOut(id, point);
  });
  gesture_.setOnDragMove([this](DragMode mode, const DragPoint& point) {
    onDragMove(mode, point);
  });
  gesture_.setOnModeChanged([this](DragMode mode) { onModeChanged(mode); });

  autoScroll_.setOnScrolled([this]() { gesture_.refreshDropIndex(); });
  resolver_.setOnResolved([this](const WindowLabel& target) {
    onTargetResolved(target);
  });
}

WindowDragCoordinator::~WindowDragCoordinator() {
  // A window closing mid-drag still ends its gesture for the other windows.
  endSession();
  timers_.cancel(snapbackTimer_);
}

void WindowDragCoordinator::setConfig(const DragConfig& cfg) {
  config_ = cfg;
  gesture_.setConfig(cfg.gesture);
  autoScroll_.setConfig(cfg.autoScroll);
  resolver_.setConfig(cfg.probe);
  broadcaster_.setConfig(cfg.springLoad);
  announcer_.setClearDelay(cfg.feedback.announcementClearMs);
}

bool WindowDragCoordinator::handlePointerDown(const TabId& tabId,
                                              const PointerEvent& ev) {
  const Tab* tab = tabs_.find(tabId);
  if (!tab) return false;
  return gesture_.onPointerDown(tabId, tab->isPinned, ev);
}

void WindowDragCoordinator::handlePointerMove(const PointerEvent& ev) {
  gesture_.onPointerMove(ev);
}

void WindowDragCoordinator::handlePointerUp(const PointerEvent& ev) {
  gesture_.onPointerUp(ev);
}

void WindowDragCoordinator::handlePointerCancel(const PointerEvent& ev) {
  gesture_.onPointerCancel(ev);
}

void WindowDragCoordinator::handleFocusLost() {
  // Spring-loading raised the target, so losing focus to it is expected.
  if (gesture_.mode() == DragMode::DragOut && broadcaster_.raisedTarget()) return;
  endSession();
}

void WindowDragCoordinator::endSession() {
  gesture_.cancel();
  // Nothing timed may outlive the gesture.
  autoScroll_.stop();
  resolver_.cancel();
  if (previewActive_) {
    broadcaster_.clear();
    previewActive_ = false;
  }
}

bool WindowDragCoordinator::handleTabKey(const TabId& tabId, const KeyChord& chord) {
  if (chord.composing) return false;

  int fromIndex = tabs_.indexOf(tabId);
  if (fromIndex < 0) return false;

  int dropIndex = keyboardDropIndex(chord, fromIndex);
  if (dropIndex >= 0) {
    commitReorder(tabId, dropIndex);
    return true;
  }

  if (chord.key == KeyCode::Enter || chord.key == KeyCode::Space) {
    if (onActivate_) onActivate_(tabId);
    return true;
  }
  return false;
}

bool WindowDragCoordinator::undo() {
  std::string what = history_.undoDescription();
  if (!history_.canUndo()) return false;
  if (!history_.undo()) {
    announcer_.announce("Could not undo " + what + ".");
    return false;
  }
  announcer_.announce("Undo: " + what + ".");
  return true;
}

bool WindowDragCoordinator::redo() {
  std::string what = history_.redoDescription();
  if (!history_.canRedo()) return false;
  if (!history_.redo()) {
    announcer_.announce("Could not redo " + what + ".");
    return false;
  }
  announcer_.announce("Redo: " + what + ".");
  return true;
}

bool WindowDragCoordinator::isReorderBlocked() const {
  const DragView& v = gesture_.view();
  if (v.mode != DragMode::Reorder || v.dropIndex < 0) return false;
  int fromIndex = tabs_.indexOf(v.draggedTabId);
  if (fromIndex < 0) return false;
  return !planReorder(tabs_.tabs(), fromIndex, v.dropIndex).allowed;
}

bool WindowDragCoordinator::isDragOutBlocked() const {
  return gesture_.mode() == DragMode::DragOut && primary_ && tabs_.count() <= 1;
}

std::string WindowDragCoordinator::dragHint() const {
  if (isDragOutBlocked()) return "Cannot move the last tab in " + label_ + " window";
  if (!dragTarget_.empty()) return "Drop to move to " + dragTarget_;
  if (gesture_.mode() == DragMode::DragOut) return "Drop to create a new window";
  if (isReorderBlocked()) return "Pinned zone is locked";
  return "Reorder tab";
}

bool WindowDragCoordinator::commitReorder(const TabId& tabId, int dropIndex) {
  const int fromIndex = tabs_.indexOf(tabId);
  if (fromIndex < 0) return false;
  const std::string title = tabs_.tabs()[static_cast<std::size_t>(fromIndex)].title;

  ReorderPlan plan = planReorder(tabs_.tabs(), fromIndex, dropIndex);
  if (!plan.allowed) {
    if (plan.blockedReason == ReorderBlock::PinnedZone) {
      triggerSnapback(tabId);
      announcer_.announce("Pinned tabs stay at the left. Drop blocked.");
    }
    return false;
  }
  if (plan.toIndex == fromIndex) return false;

  tabs_.reorderTabs(static_cast<std::size_t>(fromIndex),
                    static_cast<std::size_t>(plan.toIndex));

  const int toIndex = plan.toIndex;
  auto moveTo = [this, tabId](int index) {
    int current = tabs_.indexOf(tabId);
    if (current < 0 || tabs_.count() == 0) return false;
    int target = std::min(index, static_cast<int>(tabs_.count()) - 1);
    int lastPinned = tabs_.lastPinnedIndex();
    const bool pinned = tabs_.tabs()[static_cast<std::size_t>(current)].isPinned;
    // Pins may have changed since the move; never break the prefix.
    if (!pinned && target <= lastPinned) target = lastPinned + 1;
    if (pinned && target > lastPinned) target = lastPinned;
    return tabs_.reorderTabs(static_cast<std::size_t>(current),
                             static_cast<std::size_t>(target));
  };
  history_.record({
    "Moved \"" + title + "\"",
    [moveTo, toIndex]() { return moveTo(toIndex); },
    [moveTo, fromIndex]() { return moveTo(fromIndex); }
  });

  announcer_.announce("Reordered tab " + title + ".");
  return true;
}

void WindowDragCoordinator::commitDragOut(const TabId& tabId, const DragPoint& point) {
  lastTransfer_ = transfer_.commitDragOut(tabId, point);
  if (lastTransfer_.status == TransferStatus::NoSuchTab) return;

  if (!lastTransfer_.moved()) triggerSnapback(tabId);
  announcer_.announce(lastTransfer_.message);
}

void WindowDragCoordinator::onDragMove(DragMode mode, const DragPoint& point) {
  if (mode == DragMode::Reorder) {
    autoScroll_.update(point.clientX);
  } else if (mode == DragMode::DragOut) {
    resolver_.request(point);
  }
}

void WindowDragCoordinator::onModeChanged(DragMode mode) {
  if (mode != DragMode::Reorder) autoScroll_.stop();
  if (mode != DragMode::DragOut) {
    resolver_.cancel();
    dragTarget_.clear();
  }
  if (mode == DragMode::DragOut) previewActive_ = true;

  if (mode == DragMode::Idle && previewActive_) {
    broadcaster_.clear();
    previewActive_ = false;
  }
}

void WindowDragCoordinator::onTargetResolved(const WindowLabel& target) {
  // A late probe after release must not resurrect a preview.
  if (gesture_.mode() != DragMode::DragOut) return;
  dragTarget_ = target;
  broadcaster_.update(target);
}

void WindowDragCoordinator::triggerSnapback(const TabId& tabId) {
  snapbackTabId_ = tabId;
  timers_.cancel(snapbackTimer_);
  snapbackTimer_ = timers_.schedule(config_.feedback.snapbackMs, [this]() {
    snapbackTimer_ = kNoTimer;
    snapbackTabId_.clear();
  });
}

} // namespace dt
