#include "dt/tabs/TabStore.hpp"

#include <algorithm>

namespace dt {

TabId TabStore::createTab(const std::string& title, const std::string& filePath,
                          bool pinned) {
  Tab t;
  // Window label prefix keeps ids unique across windows.
  t.id = window_ + ":" + std::to_string(nextSerial_++);
  t.title = title;
  t.filePath = filePath;
  t.isPinned = pinned;

  if (pinned) {
    tabs_.insert(tabs_.begin() + (lastPinnedIndex() + 1), t);
  } else {
    tabs_.push_back(t);
  }
  return t.id;
}

bool TabStore::createTransferredTab(const Tab& tab) {
  if (tab.id.empty() || find(tab.id)) return false;
  Tab t = tab;
  t.isPinned = false;
  tabs_.push_back(std::move(t));
  return true;
}

bool TabStore::detachTab(const TabId& id) {
  auto it = std::find_if(tabs_.begin(), tabs_.end(),
                         [&](const Tab& t) { return t.id == id; });
  if (it == tabs_.end()) return false;
  tabs_.erase(it);
  return true;
}

bool TabStore::reorderTabs(std::size_t fromIndex, std::size_t toIndex) {
  if (fromIndex >= tabs_.size() || toIndex >= tabs_.size()) return false;
  if (fromIndex == toIndex) return true;

  Tab moving = std::move(tabs_[fromIndex]);
  tabs_.erase(tabs_.begin() + static_cast<std::ptrdiff_t>(fromIndex));
  tabs_.insert(tabs_.begin() + static_cast<std::ptrdiff_t>(toIndex),
               std::move(moving));
  return true;
}

bool TabStore::setPinned(const TabId& id, bool pinned) {
  int idx = indexOf(id);
  if (idx < 0) return false;
  if (tabs_[idx].isPinned == pinned) return true;

  Tab t = tabs_[idx];
  tabs_.erase(tabs_.begin() + idx);
  t.isPinned = pinned;
  // Land on the zone boundary so the prefix stays contiguous.
  tabs_.insert(tabs_.begin() + (lastPinnedIndex() + 1), std::move(t));
  return true;
}

const Tab* TabStore::find(const TabId& id) const {
  for (const auto& t : tabs_) {
    if (t.id == id) return &t;
  }
  return nullptr;
}

int TabStore::indexOf(const TabId& id) const {
  for (std::size_t i = 0; i < tabs_.size(); i++) {
    if (tabs_[i].id == id) return static_cast<int>(i);
  }
  return -1;
}

int TabStore::lastPinnedIndex() const {
  int last = -1;
  for (std::size_t i = 0; i < tabs_.size(); i++) {
    if (tabs_[i].isPinned) last = static_cast<int>(i);
  }
  return last;
}

} // namespace dt
