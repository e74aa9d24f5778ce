#pragma once
#include "dt/bus/MessageBus.hpp"
#include "dt/commands/CommandHistory.hpp"
#include "dt/drop/DropPreview.hpp"
#include "dt/drop/DropPreviewBroadcaster.hpp"
#include "dt/drop/DropTargetResolver.hpp"
#include "dt/geometry/AutoScroll.hpp"
#include "dt/gesture/TabDragGesture.hpp"
#include "dt/session/Announcer.hpp"
#include "dt/session/DragConfig.hpp"
#include "dt/transfer/TabTransferCoordinator.hpp"

#include <functional>
#include <string>

namespace dt {

class DocumentStore;
class ScrollTarget;
class TabStore;
class TabStripLayoutSource;

// Per-window owner of one tab drag session: routes pointer input into the
// gesture, runs auto-scroll, probing, preview broadcast and spring-loading
// while it lasts, and commits the outcome on release. Everything the
// rendering layer needs is read from here; there is no global drag state.
class WindowDragCoordinator {
public:
  WindowDragCoordinator(WindowLabel label, bool primary, TabStore& tabs,
                        DocumentStore& docs, WindowHost& host, MessageBus& bus,
                        TimerQueue& timers, const TabStripLayoutSource* layout,
                        ScrollTarget* scroll);
  ~WindowDragCoordinator();

  WindowDragCoordinator(const WindowDragCoordinator&) = delete;
  WindowDragCoordinator& operator=(const WindowDragCoordinator&) = delete;

  void setConfig(const DragConfig& cfg);
  void setPointerCapture(PointerCapture* capture) { gesture_.setPointerCapture(capture); }
  void setOnActivateTab(std::function<void(const TabId&)> cb) { onActivate_ = std::move(cb); }

  // ---- input ----
  bool handlePointerDown(const TabId& tabId, const PointerEvent& ev);
  void handlePointerMove(const PointerEvent& ev);
  void handlePointerUp(const PointerEvent& ev);
  void handlePointerCancel(const PointerEvent& ev);
  // Cancels the drag, except during a drag-out whose spring-loading has
  // raised another window (that window took the focus).
  void handleFocusLost();

  // Alt+Shift+Left/Right reorders, Enter/Space activates. Returns true if
  // the chord was consumed.
  bool handleTabKey(const TabId& tabId, const KeyChord& chord);

  bool undo();
  bool redo();

  // ---- views ----
  const DragView& view() const { return gesture_.view(); }
  DragMode mode() const { return gesture_.mode(); }
  bool isDropPreviewTarget() const { return previewListener_.isDropPreviewTarget(); }
  bool isReorderBlocked() const;
  bool isDragOutBlocked() const;
  bool isDropInvalid() const { return isReorderBlocked() || isDragOutBlocked(); }
  std::string dragHint() const;
  const std::string& announcement() const { return announcer_.message(); }
  const TabId& snapbackTabId() const { return snapbackTabId_; }
  const WindowLabel& dragTargetWindow() const { return dragTarget_; }
  const TransferOutcome& lastTransfer() const { return lastTransfer_; }

  const WindowLabel& label() const { return label_; }
  bool isPrimary() const { return primary_; }
  CommandHistory& history() { return history_; }
  const DropPreviewBroadcaster& broadcaster() const { return broadcaster_; }

private:
  bool commitReorder(const TabId& tabId, int dropIndex);
  void commitDragOut(const TabId& tabId, const DragPoint& point);
  void onDragMove(DragMode mode, const DragPoint& point);
  void onModeChanged(DragMode mode);
  void onTargetResolved(const WindowLabel& target);
  void endSession();
  void triggerSnapback(const TabId& tabId);

  WindowLabel label_;
  bool primary_;
  TabStore& tabs_;
  TimerQueue& timers_;
  DragConfig config_;

  CommandHistory history_;
  Announcer announcer_;
  TabDragGesture gesture_;
  AutoScrollController autoScroll_;
  DropTargetResolver resolver_;
  DropPreviewBroadcaster broadcaster_;
  DropPreviewListener previewListener_;
  TabTransferCoordinator transfer_;

  std::function<void(const TabId&)> onActivate_;
  WindowLabel dragTarget_;
  bool previewActive_{false};
  TransferOutcome lastTransfer_;
  TabId snapbackTabId_;
  TimerId snapbackTimer_{kNoTimer};
};

} // namespace dt
