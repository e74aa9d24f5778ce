#pragma once
#include "dt/ids/Id.hpp"

#include <string>

namespace dt {

// Screen-space rectangle of a top-level window (desktop pixels).
struct WindowBounds {
  double x{0}, y{0};
  double width{800}, height{600};

  bool contains(double sx, double sy) const {
    return sx >= x && sx < x + width && sy >= y && sy < y + height;
  }
};

// Native windowing backend behind LocalWindowHost. Optional: without one
// the host keeps bounds and z-order itself.
class WindowPlatform {
public:
  virtual ~WindowPlatform() = default;

  virtual bool createNativeWindow(const WindowLabel& label, const WindowBounds& bounds,
                                  const std::string& title) = 0;
  virtual void destroyNativeWindow(const WindowLabel& label) = 0;
  virtual bool focusNativeWindow(const WindowLabel& label) = 0;

  // Current bounds as the window manager reports them (user may have moved
  // the window). False if the native window is gone.
  virtual bool queryBounds(const WindowLabel& label, WindowBounds& out) const = 0;
};

} // namespace dt
