#pragma once
#include "dt/gesture/PointerEvent.hpp"
#include "dt/tabs/TabStore.hpp"

#include <cstdint>
#include <vector>

namespace dt {

enum class ReorderBlock : std::uint8_t { None = 0, PinnedZone };

struct ReorderPlan {
  bool allowed{false};
  int toIndex{0};
  ReorderBlock blockedReason{ReorderBlock::None};
};

// Visual insertion index (0..N, a gap between tabs) to the array index the
// tab lands on once it has been removed from fromIndex.
int normalizeInsertionIndex(int fromIndex, int dropIndex, int tabCount);

// Pinned tabs must stay a contiguous prefix: an unpinned tab may not land
// inside the pinned zone and a pinned tab may not leave it. Blocked plans
// carry the nearest legal index in toIndex; callers do not apply it.
ReorderPlan planReorder(const std::vector<Tab>& tabs, int fromIndex,
                        int visualDropIndex);

// Keyboard reorder: Alt+Shift+Left/Right map to the visual gap one slot over
// (from - 1 / from + 2). Returns -1 if the chord is not a reorder chord.
int keyboardDropIndex(const KeyChord& chord, int fromIndex);

} // namespace dt
