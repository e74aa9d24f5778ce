#include "dt/geometry/TabStripModel.hpp"
#include "dt/tabs/TabStore.hpp"

#include <algorithm>

namespace dt {

void TabStripModel::setConfig(const TabStripModelConfig& cfg) {
  config_ = cfg;
  scrollOffset_ = std::clamp(scrollOffset_, 0.0, maxScrollOffset());
}

double TabStripModel::maxScrollOffset() const {
  double content = config_.tabWidth * static_cast<double>(store_.count());
  return std::max(0.0, content - config_.stripWidth);
}

bool TabStripModel::queryLayout(StripLayout& out) const {
  if (!available_ || config_.tabWidth <= 0.0) return false;

  out.tabs.clear();
  out.tabs.reserve(store_.count());
  for (std::size_t i = 0; i < store_.count(); i++) {
    double left = config_.stripLeft + config_.tabWidth * static_cast<double>(i)
                  - scrollOffset_;
    out.tabs.push_back({left, left + config_.tabWidth});
  }
  out.barTop = config_.barTop;
  out.barBottom = config_.barTop + config_.barHeight;
  out.visibleLeft = config_.stripLeft;
  out.visibleRight = config_.stripLeft + config_.stripWidth;
  return true;
}

double TabStripModel::scrollBy(double dx) {
  double before = scrollOffset_;
  scrollOffset_ = std::clamp(scrollOffset_ + dx, 0.0, maxScrollOffset());
  return scrollOffset_ - before;
}

} // namespace dt
