#include "dt/tabs/DocumentStore.hpp"

namespace dt {

void DocumentStore::initDocument(const TabId& id, const std::string& content,
                                 const std::string& filePath,
                                 const std::string& savedContent) {
  Document d;
  d.content = content;
  d.savedContent = savedContent;
  d.filePath = filePath;
  d.isDirty = content != savedContent;
  docs_[id] = std::move(d);
}

bool DocumentStore::setContent(const TabId& id, const std::string& content) {
  auto it = docs_.find(id);
  if (it == docs_.end()) return false;
  it->second.content = content;
  it->second.isDirty = content != it->second.savedContent;
  return true;
}

bool DocumentStore::setWorkspaceRoot(const TabId& id, const std::string& root) {
  auto it = docs_.find(id);
  if (it == docs_.end()) return false;
  it->second.workspaceRoot = root;
  return true;
}

bool DocumentStore::setDirty(const TabId& id, bool dirty) {
  auto it = docs_.find(id);
  if (it == docs_.end()) return false;
  it->second.isDirty = dirty;
  return true;
}

bool DocumentStore::markSaved(const TabId& id) {
  auto it = docs_.find(id);
  if (it == docs_.end()) return false;
  it->second.savedContent = it->second.content;
  it->second.isDirty = false;
  return true;
}

bool DocumentStore::removeDocument(const TabId& id) {
  return docs_.erase(id) > 0;
}

const Document* DocumentStore::getDocument(const TabId& id) const {
  auto it = docs_.find(id);
  return it == docs_.end() ? nullptr : &it->second;
}

} // namespace dt
