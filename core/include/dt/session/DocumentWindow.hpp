#pragma once
#include "dt/geometry/TabStripModel.hpp"
#include "dt/host/WindowHost.hpp"
#include "dt/host/WindowPlatform.hpp"
#include "dt/session/WindowDragCoordinator.hpp"
#include "dt/tabs/DocumentStore.hpp"
#include "dt/tabs/TabStore.hpp"

#include <string>

namespace dt {

// One top-level document window: its tabs, their documents, the strip
// layout and the drag coordinator. Owns no state of any other window.
class DocumentWindow {
public:
  DocumentWindow(WindowLabel label, bool primary, const WindowBounds& bounds,
                 WindowHost& host, MessageBus& bus, TimerQueue& timers,
                 const DragConfig& cfg);

  DocumentWindow(const DocumentWindow&) = delete;
  DocumentWindow& operator=(const DocumentWindow&) = delete;

  // Opens a tab plus its document (content starts saved).
  TabId openDocument(const std::string& title, const std::string& filePath,
                     const std::string& content, bool pinned = false);

  // Destination side of a transfer: creates tab + document together.
  HostResult receiveTransfer(const TransferPayload& payload);

  // Removes tab + document together.
  HostResult removeTab(const TabId& tabId);

  const WindowLabel& label() const { return label_; }
  bool isPrimary() const { return primary_; }
  const WindowBounds& bounds() const { return bounds_; }
  void setBounds(const WindowBounds& b) { bounds_ = b; }

  TabStore& tabs() { return tabs_; }
  const TabStore& tabs() const { return tabs_; }
  DocumentStore& docs() { return docs_; }
  const DocumentStore& docs() const { return docs_; }
  TabStripModel& strip() { return strip_; }
  WindowDragCoordinator& drag() { return drag_; }
  const WindowDragCoordinator& drag() const { return drag_; }

private:
  WindowLabel label_;
  bool primary_;
  WindowBounds bounds_;
  TabStore tabs_;
  DocumentStore docs_;
  TabStripModel strip_;
  WindowDragCoordinator drag_;
};

} // namespace dt
