#include "dt/transfer/TabTransferCoordinator.hpp"
#include "dt/commands/CommandHistory.hpp"
#include "dt/drop/DropTargetResolver.hpp"
#include "dt/tabs/DocumentStore.hpp"
#include "dt/tabs/TabStore.hpp"

#include <cstdio>
#include <memory>
#include <utility>

namespace dt {

TabTransferCoordinator::TabTransferCoordinator(WindowLabel source,
                                               bool sourceIsPrimary,
                                               TabStore& tabs, DocumentStore& docs,
                                               WindowHost& host,
                                               DropTargetResolver& resolver,
                                               CommandHistory& history)
  : source_(std::move(source)), sourceIsPrimary_(sourceIsPrimary),
    tabs_(tabs), docs_(docs), host_(host), resolver_(resolver),
    history_(history) {}

bool TabTransferCoordinator::buildPayload(const TabId& tabId,
                                          TransferPayload& out) const {
  const Tab* tab = tabs_.find(tabId);
  const Document* doc = docs_.getDocument(tabId);
  if (!tab || !doc) return false;

  out.tabId = tab->id;
  out.title = tab->title;
  out.filePath = tab->filePath;
  out.content = doc->content;
  out.savedContent = doc->savedContent;
  out.isDirty = doc->isDirty;
  out.workspaceRoot = doc->workspaceRoot;
  return true;
}

TransferOutcome TabTransferCoordinator::commitDragOut(const TabId& tabId,
                                                      const DragPoint& point) {
  TransferOutcome out;
  const Tab* tab = tabs_.find(tabId);
  if (!tab) return out;

  // Policy checks run before any host call.
  if (tab->isPinned) {
    out.status = TransferStatus::BlockedPinned;
    out.message = "Pinned tabs cannot be moved to another window.";
    return out;
  }
  if (sourceIsPrimary_ && tabs_.count() <= 1) {
    out.status = TransferStatus::BlockedLastPrimaryTab;
    out.message = "Cannot move the last tab in the " + source_ + " window.";
    return out;
  }

  TransferPayload payload;
  if (!buildPayload(tabId, payload)) {
    std::fprintf(stderr, "[TabTransferCoordinator] %s: tab '%s' has no document\n",
                 source_.c_str(), tabId.c_str());
    return out;
  }
  const std::string title = payload.title;

  HostResult probe = resolver_.resolveNow(point);
  if (!probe.ok) {
    // Unknown target: fall back to a new window rather than guessing.
    std::fprintf(stderr, "[TabTransferCoordinator] %s: drop probe failed: %s (%s)\n",
                 source_.c_str(), probe.err.code.c_str(), probe.err.message.c_str());
    probe.window.clear();
  }

  HostResult placed = relocate(payload, probe.window);
  if (!placed.ok) {
    std::fprintf(stderr, "[TabTransferCoordinator] %s: moving '%s' failed: %s (%s)\n",
                 source_.c_str(), tabId.c_str(), placed.err.code.c_str(),
                 placed.err.message.c_str());
    out.status = TransferStatus::Failed;
    out.message = "Failed to move tab " + title + ".";
    return out;
  }

  const WindowLabel destination = placed.window;
  const bool spawned = probe.window.empty() || destination != probe.window;

  removeFromSource(tabId);

  // Shared between both steps: a redo may land in a different window.
  auto where = std::make_shared<WindowLabel>(destination);
  history_.record({
    std::string(spawned ? "Detached \"" : "Moved \"") + title + "\"",
    [this, where, payload]() { return redoTo(*where, payload); },
    [this, where, payload]() { return restoreFrom(*where, payload); }
  });

  if (tabs_.count() == 0 && !sourceIsPrimary_) {
    HostResult closed = host_.closeWindow(source_);
    if (!closed.ok) {
      std::fprintf(stderr, "[TabTransferCoordinator] %s: close request failed: %s\n",
                   source_.c_str(), closed.err.message.c_str());
    }
  }

  out.targetWindow = destination;
  if (spawned) {
    out.status = TransferStatus::DetachedToNewWindow;
    out.message = "Detached tab " + title + " into a new window.";
  } else {
    out.status = TransferStatus::MovedToWindow;
    out.message = "Moved tab " + title + " to another window.";
  }
  return out;
}

HostResult TabTransferCoordinator::relocate(const TransferPayload& payload,
                                            const WindowLabel& preferred) {
  if (!preferred.empty()) {
    HostResult injected = host_.injectTabIntoWindow(preferred, payload);
    if (injected.ok) {
      injected.window = preferred;
      return injected;
    }
    // The target may have closed after the probe; only then spawn instead.
    if (injected.err.code != "WINDOW_GONE") return injected;
    std::fprintf(stderr,
                 "[TabTransferCoordinator] %s: '%s' went away, spawning a window\n",
                 source_.c_str(), preferred.c_str());
  }
  return host_.spawnWindowWithTab(payload);
}

void TabTransferCoordinator::removeFromSource(const TabId& tabId) {
  tabs_.detachTab(tabId);
  docs_.removeDocument(tabId);
}

bool TabTransferCoordinator::restoreFrom(const WindowLabel& destination,
                                         const TransferPayload& payload) {
  if (tabs_.find(payload.tabId)) return false;

  HostResult removed = host_.removeTabFromWindow(destination, payload.tabId);
  if (!removed.ok) {
    std::fprintf(stderr, "[TabTransferCoordinator] %s: undo failed: %s (%s)\n",
                 source_.c_str(), removed.err.code.c_str(),
                 removed.err.message.c_str());
    return false;
  }

  Tab tab;
  tab.id = payload.tabId;
  tab.title = payload.title;
  tab.filePath = payload.filePath;
  tabs_.createTransferredTab(tab);

  docs_.initDocument(payload.tabId, payload.content, payload.filePath,
                     payload.savedContent);
  docs_.setDirty(payload.tabId, payload.isDirty);
  docs_.setWorkspaceRoot(payload.tabId, payload.workspaceRoot);
  return true;
}

bool TabTransferCoordinator::redoTo(WindowLabel& destination,
                                    const TransferPayload& original) {
  // Send what the tab holds now, not what it held at the first move.
  TransferPayload payload;
  if (!buildPayload(original.tabId, payload)) return false;

  HostResult placed = relocate(payload, destination);
  if (!placed.ok) {
    std::fprintf(stderr, "[TabTransferCoordinator] %s: redo failed: %s (%s)\n",
                 source_.c_str(), placed.err.code.c_str(),
                 placed.err.message.c_str());
    return false;
  }
  destination = placed.window;
  removeFromSource(original.tabId);
  return true;
}

} // namespace dt
