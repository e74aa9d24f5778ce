#pragma once
#include <vector>

namespace dt {

// Horizontal extent of one tab in window-local pixels.
struct TabExtent {
  double left{0};
  double right{0};
};

// Snapshot of a tab strip's on-screen layout (window-local pixels).
struct StripLayout {
  std::vector<TabExtent> tabs;
  double barTop{0};
  double barBottom{0};
  double visibleLeft{0};
  double visibleRight{0};
};

// Provider of the live strip layout. Returns false while the layout cannot
// be queried (window teardown, strip not yet laid out).
class TabStripLayoutSource {
public:
  virtual ~TabStripLayoutSource() = default;
  virtual bool queryLayout(StripLayout& out) const = 0;
};

// Something the auto-scroller can move. Returns the delta actually applied
// after clamping.
class ScrollTarget {
public:
  virtual ~ScrollTarget() = default;
  virtual double scrollBy(double dx) = 0;
};

// Insertion index for pointer x: the first tab whose midpoint lies right of
// x, or tabs.size() to append. -1 when there are no tabs to measure.
int calcDropIndex(const std::vector<TabExtent>& tabs, double x);

// Index of the tab under (x, y), or -1 outside the bar or between tabs.
int hitTestTab(const StripLayout& layout, double x, double y);

// True if y is more than margin above barTop or below barBottom.
bool isOutsideVerticalBand(double barTop, double barBottom, double y,
                           double margin);

} // namespace dt
