#pragma once
#include "dt/gesture/PointerEvent.hpp"
#include "dt/host/WindowPlatform.hpp"

#ifdef DT_HAS_GLFW

#include <functional>
#include <memory>
#include <unordered_map>

struct GLFWwindow;

namespace dt {

enum class PointerPhase : std::uint8_t { Down, Move, Up, FocusLost };

// GLFW-backed native windows. Client coordinates come straight from GLFW;
// screen coordinates add the window position.
class GlfwWindowPlatform : public WindowPlatform {
public:
  using PointerSink = std::function<void(const WindowLabel&, PointerPhase, const PointerEvent&)>;

  GlfwWindowPlatform();
  ~GlfwWindowPlatform() override;

  GlfwWindowPlatform(const GlfwWindowPlatform&) = delete;
  GlfwWindowPlatform& operator=(const GlfwWindowPlatform&) = delete;

  bool init();
  void setPointerSink(PointerSink sink) { sink_ = std::move(sink); }

  bool createNativeWindow(const WindowLabel& label, const WindowBounds& bounds,
                          const std::string& title) override;
  void destroyNativeWindow(const WindowLabel& label) override;
  bool focusNativeWindow(const WindowLabel& label) override;
  bool queryBounds(const WindowLabel& label, WindowBounds& out) const override;

  void setTitle(const WindowLabel& label, const std::string& title);
  void pollEvents();
  bool shouldClose(const WindowLabel& label) const;
  std::size_t windowCount() const { return windows_.size(); }

private:
  struct NativeWindow {
    GlfwWindowPlatform* owner{nullptr};
    WindowLabel label;
    GLFWwindow* handle{nullptr};
    double cursorX{0};
    double cursorY{0};
  };

  void emit(NativeWindow& nw, PointerPhase phase, int button);

  bool initialized_{false};
  PointerSink sink_;
  std::unordered_map<WindowLabel, std::unique_ptr<NativeWindow>> windows_;

  static void cursorPosCallback(GLFWwindow* w, double x, double y);
  static void mouseButtonCallback(GLFWwindow* w, int button, int action, int mods);
  static void focusCallback(GLFWwindow* w, int focused);
};

} // namespace dt

#endif // DT_HAS_GLFW
