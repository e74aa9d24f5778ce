#pragma once
#include "dt/drop/DropPreviewBroadcaster.hpp"
#include "dt/drop/DropTargetResolver.hpp"
#include "dt/geometry/AutoScroll.hpp"
#include "dt/gesture/TabDragGesture.hpp"
#include "dt/ids/Id.hpp"

#include <string>

namespace dt {

struct FeedbackConfig {
  int snapbackMs{180};
  int announcementClearMs{1200};
};

// Every tunable of the tab drag pipeline in one place.
struct DragConfig {
  GestureConfig gesture;
  AutoScrollConfig autoScroll;
  DropProbeConfig probe;
  SpringLoadConfig springLoad;
  FeedbackConfig feedback;
  WindowLabel primaryWindow{kPrimaryWindowLabel};
};

std::string serializeDragConfig(const DragConfig& cfg);

// Missing keys keep the values already in out. Returns false (and leaves
// out untouched) on malformed JSON or a wrongly typed value.
bool deserializeDragConfig(const std::string& json, DragConfig& out);

} // namespace dt
