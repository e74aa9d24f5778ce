#include "dt/geometry/TabStripGeometry.hpp"

namespace dt {

int calcDropIndex(const std::vector<TabExtent>& tabs, double x) {
  if (tabs.empty()) return -1;

  for (std::size_t i = 0; i < tabs.size(); i++) {
    double midX = (tabs[i].left + tabs[i].right) * 0.5;
    if (x < midX) return static_cast<int>(i);
  }
  return static_cast<int>(tabs.size());
}

int hitTestTab(const StripLayout& layout, double x, double y) {
  if (y < layout.barTop || y >= layout.barBottom) return -1;
  if (x < layout.visibleLeft || x >= layout.visibleRight) return -1;

  for (std::size_t i = 0; i < layout.tabs.size(); i++) {
    if (x >= layout.tabs[i].left && x < layout.tabs[i].right) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

bool isOutsideVerticalBand(double barTop, double barBottom, double y,
                           double margin) {
  return y > barBottom + margin || y < barTop - margin;
}

} // namespace dt
