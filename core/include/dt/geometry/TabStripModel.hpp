#pragma once
#include "dt/geometry/TabStripGeometry.hpp"

namespace dt {

class TabStore;

struct TabStripModelConfig {
  double barTop{0};
  double barHeight{32};
  double stripLeft{0};
  double stripWidth{600};
  double tabWidth{120};
};

// Non-rendering model of a horizontally scrolling tab strip: uniform tab
// width, clamped scroll offset. Serves both the hit-test and the
// auto-scroller.
class TabStripModel : public TabStripLayoutSource, public ScrollTarget {
public:
  explicit TabStripModel(const TabStore& store) : store_(store) {}

  void setConfig(const TabStripModelConfig& cfg);
  const TabStripModelConfig& config() const { return config_; }

  // Marks the layout as not queryable (teardown, hidden window).
  void setAvailable(bool available) { available_ = available; }

  bool queryLayout(StripLayout& out) const override;
  double scrollBy(double dx) override;

  double scrollOffset() const { return scrollOffset_; }
  double maxScrollOffset() const;

private:
  const TabStore& store_;
  TabStripModelConfig config_;
  double scrollOffset_{0};
  bool available_{true};
};

} // namespace dt
