#pragma once
#include "dt/host/WindowHost.hpp"
#include "dt/host/WindowPlatform.hpp"
#include "dt/session/DocumentWindow.hpp"
#include "dt/session/DragConfig.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace dt {

class MessageBus;
class TimerQueue;

// In-process host owning every document window. Keeps screen bounds and a
// z-order (front = top-most); a WindowPlatform, when set, supplies real
// native windows and their live bounds.
//
// Transfers still cross the boundary as JSON: inject and spawn encode the
// payload and the destination decodes it. A spawned window claims its seed
// transfer on the next pump(), and close requests are carried out there too,
// so no window is destroyed inside a call stack that belongs to it.
class LocalWindowHost : public WindowHost {
public:
  LocalWindowHost(MessageBus& bus, TimerQueue& timers);
  ~LocalWindowHost() override;

  void setConfig(const DragConfig& cfg);
  const DragConfig& config() const { return config_; }
  void setPlatform(WindowPlatform* platform) { platform_ = platform; }

  // nullptr if the label is taken or the native window cannot be created.
  DocumentWindow* openWindow(const WindowLabel& label, const WindowBounds& bounds);

  DocumentWindow* window(const WindowLabel& label);
  const DocumentWindow* window(const WindowLabel& label) const;

  // Top-most first; windows waiting to close are left out.
  std::vector<WindowLabel> windowLabels() const;
  std::size_t windowCount() const { return windows_.size(); }
  WindowLabel focusedWindow() const;

  std::size_t pendingTransferCount() const { return pendingTransfers_.size(); }
  bool isClosing(const WindowLabel& label) const;

  // Claims seed transfers, then destroys windows whose close was requested.
  // Returns the number of windows destroyed.
  std::size_t pump();

  // ---- WindowHost ----
  HostResult findWindowUnderPoint(double screenX, double screenY,
                                  const WindowLabel& excluding) override;
  HostResult injectTabIntoWindow(const WindowLabel& window,
                                 const TransferPayload& payload) override;
  HostResult spawnWindowWithTab(const TransferPayload& payload) override;
  HostResult removeTabFromWindow(const WindowLabel& window, const TabId& tabId) override;
  HostResult focusWindow(const WindowLabel& window) override;
  HostResult closeWindow(const WindowLabel& window) override;

private:
  struct Slot {
    std::unique_ptr<DocumentWindow> window;
    bool closing{false};
  };

  int findSlot(const WindowLabel& label) const;
  void refreshBounds(Slot& slot);
  void claimPendingTransfers();
  WindowLabel nextSpawnLabel();

  MessageBus& bus_;
  TimerQueue& timers_;
  WindowPlatform* platform_{nullptr};
  DragConfig config_;

  std::vector<Slot> windows_;                                   // z-order
  std::unordered_map<WindowLabel, std::string> pendingTransfers_; // label -> payload JSON
  std::uint64_t spawnSerial_{1};
};

} // namespace dt
