#pragma once
#include "dt/ids/Id.hpp"
#include "dt/transfer/TransferPayload.hpp"

#include <string>
#include <utility>

namespace dt {

struct HostError {
  std::string code;     // e.g. "WINDOW_GONE"
  std::string message;  // human text
};

struct HostResult {
  bool ok{true};
  HostError err{};
  WindowLabel window;   // resolved / created window, empty if none
};

inline HostResult hostOk(WindowLabel window = {}) {
  HostResult r;
  r.window = std::move(window);
  return r;
}

inline HostResult hostFail(const std::string& code, const std::string& message) {
  HostResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  return r;
}

// Host windowing layer. Every call crosses a window (process) boundary;
// a window may disappear between any two calls.
class WindowHost {
public:
  virtual ~WindowHost() = default;

  // Top-most window containing the screen point, other than excluding.
  // ok with an empty window means "no window there".
  virtual HostResult findWindowUnderPoint(double screenX, double screenY,
                                          const WindowLabel& excluding) = 0;

  // Acknowledged only once the destination owns the tab and its document.
  virtual HostResult injectTabIntoWindow(const WindowLabel& window,
                                         const TransferPayload& payload) = 0;

  // Creates a window seeded with the payload; result.window is its label.
  virtual HostResult spawnWindowWithTab(const TransferPayload& payload) = 0;

  virtual HostResult removeTabFromWindow(const WindowLabel& window,
                                         const TabId& tabId) = 0;
  virtual HostResult focusWindow(const WindowLabel& window) = 0;

  // Request only: the window closes once control returns to its loop.
  virtual HostResult closeWindow(const WindowLabel& window) = 0;
};

} // namespace dt
