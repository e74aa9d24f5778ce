#pragma once
#include "dt/ids/Id.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace dt {

struct Tab {
  TabId id;
  std::string title;
  std::string filePath;   // empty = untitled
  bool isPinned{false};
};

// Ordered tab collection for one window. Pinned tabs always form a
// contiguous prefix of the order.
class TabStore {
public:
  explicit TabStore(WindowLabel window) : window_(std::move(window)) {}

  // Creates a tab with a fresh id. Pinned tabs go to the end of the
  // pinned prefix, unpinned tabs to the end of the strip.
  TabId createTab(const std::string& title, const std::string& filePath,
                  bool pinned = false);

  // Appends a tab that arrived from another window (always unpinned).
  // Returns false if the id is already present.
  bool createTransferredTab(const Tab& tab);

  bool detachTab(const TabId& id);
  bool reorderTabs(std::size_t fromIndex, std::size_t toIndex);
  bool setPinned(const TabId& id, bool pinned);

  const Tab* find(const TabId& id) const;
  int indexOf(const TabId& id) const;
  int lastPinnedIndex() const;

  const std::vector<Tab>& tabs() const { return tabs_; }
  std::size_t count() const { return tabs_.size(); }
  const WindowLabel& window() const { return window_; }

private:
  WindowLabel window_;
  std::vector<Tab> tabs_;
  std::uint32_t nextSerial_{1};
};

} // namespace dt
