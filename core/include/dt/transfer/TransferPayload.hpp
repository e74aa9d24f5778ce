#pragma once
#include "dt/ids/Id.hpp"

#include <string>

namespace dt {

// Point-in-time copy of a tab and its document, sent across the window
// boundary. Empty filePath / workspaceRoot travel as JSON null.
struct TransferPayload {
  TabId tabId;
  std::string title;
  std::string filePath;
  std::string content;
  std::string savedContent;
  bool isDirty{false};
  std::string workspaceRoot;
};

std::string encodeTransferPayload(const TransferPayload& payload);

// Returns false on malformed JSON or a missing tabId; out is left untouched.
bool decodeTransferPayload(const std::string& json, TransferPayload& out);

bool operator==(const TransferPayload& a, const TransferPayload& b);
inline bool operator!=(const TransferPayload& a, const TransferPayload& b) {
  return !(a == b);
}

} // namespace dt
