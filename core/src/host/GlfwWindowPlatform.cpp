#ifdef DT_HAS_GLFW

#include "dt/host/GlfwWindowPlatform.hpp"
#include <GLFW/glfw3.h>
#include <cstdio>

namespace dt {

GlfwWindowPlatform::GlfwWindowPlatform() = default;

GlfwWindowPlatform::~GlfwWindowPlatform() {
  for (auto& [label, nw] : windows_) {
    if (nw->handle) glfwDestroyWindow(nw->handle);
  }
  windows_.clear();
  if (initialized_) glfwTerminate();
}

bool GlfwWindowPlatform::init() {
  if (initialized_) return true;
  if (!glfwInit()) {
    std::fprintf(stderr, "[GlfwWindowPlatform] glfwInit failed\n");
    return false;
  }
  initialized_ = true;
  return true;
}

bool GlfwWindowPlatform::createNativeWindow(const WindowLabel& label,
                                            const WindowBounds& bounds,
                                            const std::string& title) {
  if (!initialized_ || windows_.count(label)) return false;

  // Windows are input surfaces only; nothing draws into them.
  glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
  glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);

  GLFWwindow* handle = glfwCreateWindow(static_cast<int>(bounds.width),
                                        static_cast<int>(bounds.height),
                                        title.c_str(), nullptr, nullptr);
  if (!handle) {
    std::fprintf(stderr, "[GlfwWindowPlatform] glfwCreateWindow failed for '%s'\n",
                 label.c_str());
    return false;
  }
  glfwSetWindowPos(handle, static_cast<int>(bounds.x), static_cast<int>(bounds.y));

  auto nw = std::make_unique<NativeWindow>();
  nw->owner = this;
  nw->label = label;
  nw->handle = handle;

  glfwSetWindowUserPointer(handle, nw.get());
  glfwSetCursorPosCallback(handle, cursorPosCallback);
  glfwSetMouseButtonCallback(handle, mouseButtonCallback);
  glfwSetWindowFocusCallback(handle, focusCallback);
  glfwShowWindow(handle);

  windows_[label] = std::move(nw);
  return true;
}

void GlfwWindowPlatform::destroyNativeWindow(const WindowLabel& label) {
  auto it = windows_.find(label);
  if (it == windows_.end()) return;
  glfwDestroyWindow(it->second->handle);
  windows_.erase(it);
}

bool GlfwWindowPlatform::focusNativeWindow(const WindowLabel& label) {
  auto it = windows_.find(label);
  if (it == windows_.end()) return false;
  glfwFocusWindow(it->second->handle);
  return true;
}

bool GlfwWindowPlatform::queryBounds(const WindowLabel& label, WindowBounds& out) const {
  auto it = windows_.find(label);
  if (it == windows_.end()) return false;

  int x = 0, y = 0, w = 0, h = 0;
  glfwGetWindowPos(it->second->handle, &x, &y);
  glfwGetWindowSize(it->second->handle, &w, &h);
  out.x = x;
  out.y = y;
  out.width = w;
  out.height = h;
  return true;
}

void GlfwWindowPlatform::setTitle(const WindowLabel& label, const std::string& title) {
  auto it = windows_.find(label);
  if (it != windows_.end()) glfwSetWindowTitle(it->second->handle, title.c_str());
}

void GlfwWindowPlatform::pollEvents() {
  glfwPollEvents();
}

bool GlfwWindowPlatform::shouldClose(const WindowLabel& label) const {
  auto it = windows_.find(label);
  return it == windows_.end() || glfwWindowShouldClose(it->second->handle);
}

void GlfwWindowPlatform::emit(NativeWindow& nw, PointerPhase phase, int button) {
  if (!sink_) return;

  int wx = 0, wy = 0;
  glfwGetWindowPos(nw.handle, &wx, &wy);

  PointerEvent ev;
  ev.kind = PointerKind::Mouse;
  ev.button = button;
  ev.clientX = nw.cursorX;
  ev.clientY = nw.cursorY;
  ev.screenX = wx + nw.cursorX;
  ev.screenY = wy + nw.cursorY;

  // The sink may destroy windows; copy the label first.
  WindowLabel label = nw.label;
  sink_(label, phase, ev);
}

void GlfwWindowPlatform::cursorPosCallback(GLFWwindow* w, double x, double y) {
  auto* nw = static_cast<NativeWindow*>(glfwGetWindowUserPointer(w));
  if (!nw) return;
  nw->cursorX = x;
  nw->cursorY = y;
  nw->owner->emit(*nw, PointerPhase::Move, 0);
}

void GlfwWindowPlatform::mouseButtonCallback(GLFWwindow* w, int button, int action,
                                             int /*mods*/) {
  auto* nw = static_cast<NativeWindow*>(glfwGetWindowUserPointer(w));
  if (!nw) return;
  int mapped = button == GLFW_MOUSE_BUTTON_LEFT ? 0 : button;
  nw->owner->emit(*nw, action == GLFW_PRESS ? PointerPhase::Down : PointerPhase::Up, mapped);
}

void GlfwWindowPlatform::focusCallback(GLFWwindow* w, int focused) {
  auto* nw = static_cast<NativeWindow*>(glfwGetWindowUserPointer(w));
  if (!nw || focused) return;
  nw->owner->emit(*nw, PointerPhase::FocusLost, 0);
}

} // namespace dt

#endif // DT_HAS_GLFW
