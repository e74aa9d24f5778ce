#pragma once
#include <cstdint>

namespace dt {

enum class PointerKind : std::uint8_t { Mouse = 0, Touch, Pen };

// Generic pointer snapshot, not tied to any windowing toolkit.
// client* = window-local pixels, screen* = desktop pixels.
struct PointerEvent {
  std::int32_t pointerId{1};
  PointerKind kind{PointerKind::Mouse};
  int button{0};  // 0 = primary
  double clientX{0}, clientY{0};
  double screenX{0}, screenY{0};
};

struct DragPoint {
  double clientX{0}, clientY{0};
  double screenX{0}, screenY{0};
};

inline DragPoint toDragPoint(const PointerEvent& ev) {
  return {ev.clientX, ev.clientY, ev.screenX, ev.screenY};
}

enum class KeyCode : std::uint8_t {
  None = 0, Left, Right, Enter, Space
};

struct KeyChord {
  KeyCode key{KeyCode::None};
  bool alt{false};
  bool shift{false};
  bool composing{false};  // IME composition in progress
};

// Exclusive pointer tracking. Both calls are best-effort: a refusal only
// means events arrive through the window-wide route instead.
class PointerCapture {
public:
  virtual ~PointerCapture() = default;
  virtual bool acquire(std::int32_t pointerId) = 0;
  virtual bool release(std::int32_t pointerId) = 0;
};

} // namespace dt
