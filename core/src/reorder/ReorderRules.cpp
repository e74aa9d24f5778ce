#include "dt/reorder/ReorderRules.hpp"

#include <algorithm>

namespace dt {

int normalizeInsertionIndex(int fromIndex, int dropIndex, int tabCount) {
  int toIndex = dropIndex;
  // Removing the tab first shifts every later slot left by one.
  if (fromIndex < dropIndex) toIndex = dropIndex - 1;
  return std::max(0, std::min(toIndex, tabCount - 1));
}

ReorderPlan planReorder(const std::vector<Tab>& tabs, int fromIndex,
                        int visualDropIndex) {
  ReorderPlan plan;
  const int count = static_cast<int>(tabs.size());
  if (fromIndex < 0 || fromIndex >= count) {
    plan.toIndex = fromIndex;
    return plan;
  }

  const int toIndex = normalizeInsertionIndex(fromIndex, visualDropIndex, count);
  const Tab& tab = tabs[static_cast<std::size_t>(fromIndex)];

  int lastPinned = -1;
  for (int i = 0; i < count; i++) {
    if (tabs[static_cast<std::size_t>(i)].isPinned) lastPinned = i;
  }

  if (!tab.isPinned && toIndex <= lastPinned) {
    plan.toIndex = std::max(lastPinned + 1, 0);
    plan.blockedReason = ReorderBlock::PinnedZone;
    return plan;
  }
  if (tab.isPinned && toIndex > lastPinned) {
    plan.toIndex = std::max(lastPinned, 0);
    plan.blockedReason = ReorderBlock::PinnedZone;
    return plan;
  }

  plan.allowed = true;
  plan.toIndex = toIndex;
  return plan;
}

int keyboardDropIndex(const KeyChord& chord, int fromIndex) {
  if (chord.composing || !chord.alt || !chord.shift || fromIndex < 0) return -1;
  if (chord.key == KeyCode::Left) return fromIndex > 0 ? fromIndex - 1 : 0;
  if (chord.key == KeyCode::Right) return fromIndex + 2;
  return -1;
}

} // namespace dt
