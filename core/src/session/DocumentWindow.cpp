#include "dt/session/DocumentWindow.hpp"

#include <utility>

namespace dt {

DocumentWindow::DocumentWindow(WindowLabel label, bool primary,
                               const WindowBounds& bounds, WindowHost& host,
                               MessageBus& bus, TimerQueue& timers,
                               const DragConfig& cfg)
  : label_(std::move(label)), primary_(primary), bounds_(bounds),
    tabs_(label_), strip_(tabs_),
    drag_(label_, primary, tabs_, docs_, host, bus, timers, &strip_, &strip_) {
  TabStripModelConfig sc = strip_.config();
  sc.stripWidth = bounds.width;
  strip_.setConfig(sc);
  drag_.setConfig(cfg);
}

TabId DocumentWindow::openDocument(const std::string& title,
                                   const std::string& filePath,
                                   const std::string& content, bool pinned) {
  TabId id = tabs_.createTab(title, filePath, pinned);
  docs_.initDocument(id, content, filePath, content);
  return id;
}

HostResult DocumentWindow::receiveTransfer(const TransferPayload& payload) {
  Tab tab;
  tab.id = payload.tabId;
  tab.title = payload.title;
  tab.filePath = payload.filePath;
  if (!tabs_.createTransferredTab(tab)) {
    return hostFail("TAB_EXISTS", "tab '" + payload.tabId + "' already open in " + label_);
  }

  docs_.initDocument(payload.tabId, payload.content, payload.filePath,
                     payload.savedContent);
  docs_.setDirty(payload.tabId, payload.isDirty);
  docs_.setWorkspaceRoot(payload.tabId, payload.workspaceRoot);
  return hostOk(label_);
}

HostResult DocumentWindow::removeTab(const TabId& tabId) {
  if (!tabs_.detachTab(tabId)) {
    return hostFail("NO_SUCH_TAB", "tab '" + tabId + "' is not open in " + label_);
  }
  docs_.removeDocument(tabId);
  return hostOk(label_);
}

} // namespace dt
