#pragma once
#include "dt/ids/Id.hpp"

#include <string>
#include <unordered_map>

namespace dt {

struct Document {
  std::string content;
  std::string savedContent;
  std::string filePath;
  std::string workspaceRoot;
  bool isDirty{false};
};

// Documents keyed by tab id. A window keeps exactly one Document per live
// Tab; callers remove both in the same step.
class DocumentStore {
public:
  // isDirty is derived from content != savedContent.
  void initDocument(const TabId& id, const std::string& content,
                    const std::string& filePath,
                    const std::string& savedContent);

  bool setContent(const TabId& id, const std::string& content);
  bool setWorkspaceRoot(const TabId& id, const std::string& root);
  bool setDirty(const TabId& id, bool dirty);
  bool markSaved(const TabId& id);
  bool removeDocument(const TabId& id);

  const Document* getDocument(const TabId& id) const;
  std::size_t count() const { return docs_.size(); }

private:
  std::unordered_map<TabId, Document> docs_;
};

} // namespace dt
