#pragma once
#include "dt/gesture/PointerEvent.hpp"
#include "dt/host/WindowHost.hpp"
#include "dt/ids/Id.hpp"
#include "dt/transfer/TransferPayload.hpp"

#include <cstdint>
#include <string>

namespace dt {

class CommandHistory;
class DocumentStore;
class DropTargetResolver;
class TabStore;

enum class TransferStatus : std::uint8_t {
  MovedToWindow = 0,
  DetachedToNewWindow,
  BlockedPinned,
  BlockedLastPrimaryTab,
  Failed,
  NoSuchTab
};

struct TransferOutcome {
  TransferStatus status{TransferStatus::NoSuchTab};
  WindowLabel targetWindow;
  std::string message;   // announcement text; empty for NoSuchTab

  bool moved() const {
    return status == TransferStatus::MovedToWindow ||
           status == TransferStatus::DetachedToNewWindow;
  }
  bool blocked() const {
    return status == TransferStatus::BlockedPinned ||
           status == TransferStatus::BlockedLastPrimaryTab;
  }
};

// Relocates a dragged-out tab into another window (or a new one). The
// source copy is only deleted after the destination acknowledged, so a
// document never has two owners and never has none.
class TabTransferCoordinator {
public:
  TabTransferCoordinator(WindowLabel source, bool sourceIsPrimary,
                         TabStore& tabs, DocumentStore& docs, WindowHost& host,
                         DropTargetResolver& resolver, CommandHistory& history);

  TransferOutcome commitDragOut(const TabId& tabId, const DragPoint& point);

  // Snapshot of the live tab + document; false if either is missing.
  bool buildPayload(const TabId& tabId, TransferPayload& out) const;

  const WindowLabel& source() const { return source_; }

private:
  // Hands the payload to `preferred` (or spawns when it is empty / gone).
  HostResult relocate(const TransferPayload& payload,
                      const WindowLabel& preferred);
  void removeFromSource(const TabId& tabId);
  bool restoreFrom(const WindowLabel& destination, const TransferPayload& payload);
  bool redoTo(WindowLabel& destination, const TransferPayload& payload);

  WindowLabel source_;
  bool sourceIsPrimary_;
  TabStore& tabs_;
  DocumentStore& docs_;
  WindowHost& host_;
  DropTargetResolver& resolver_;
  CommandHistory& history_;
};

} // namespace dt
