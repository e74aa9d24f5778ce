#pragma once
#include "dt/bus/MessageBus.hpp"
#include "dt/ids/Id.hpp"

#include <string>

namespace dt {

inline constexpr const char* kDropPreviewEvent = "tab:drop-preview";

// Latest candidate target of a drag-out. Superseded by every new broadcast;
// an empty targetWindow (JSON null) clears previews everywhere.
struct DropPreviewEvent {
  WindowLabel sourceWindow;
  WindowLabel targetWindow;
};

std::string encodeDropPreview(const DropPreviewEvent& ev);
bool decodeDropPreview(const std::string& json, DropPreviewEvent& out);

// Per-window consumer: decides whether this window shows a drop affordance.
class DropPreviewListener {
public:
  DropPreviewListener(MessageBus& bus, WindowLabel self);

  bool isDropPreviewTarget() const { return isTarget_; }
  const WindowLabel& lastSource() const { return lastSource_; }

private:
  void onMessage(const std::string& payloadJson);

  WindowLabel self_;
  WindowLabel lastSource_;
  bool isTarget_{false};
  Subscription sub_;
};

} // namespace dt
