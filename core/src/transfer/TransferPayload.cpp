#include "dt/transfer/TransferPayload.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

#include <utility>

namespace dt {

namespace {

void writeNullableString(rapidjson::Writer<rapidjson::StringBuffer>& w,
                         const std::string& s) {
  if (s.empty()) {
    w.Null();
  } else {
    w.String(s.c_str(), static_cast<rapidjson::SizeType>(s.size()));
  }
}

bool readString(const rapidjson::Value& obj, const char* key, std::string& out) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return false;
  if (it->value.IsNull()) {
    out.clear();
    return true;
  }
  if (!it->value.IsString()) return false;
  out.assign(it->value.GetString(), it->value.GetStringLength());
  return true;
}

} // namespace

std::string encodeTransferPayload(const TransferPayload& p) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();
  w.Key("tabId");
  w.String(p.tabId.c_str(), static_cast<rapidjson::SizeType>(p.tabId.size()));
  w.Key("title");
  w.String(p.title.c_str(), static_cast<rapidjson::SizeType>(p.title.size()));
  w.Key("filePath");      writeNullableString(w, p.filePath);
  w.Key("content");
  w.String(p.content.c_str(), static_cast<rapidjson::SizeType>(p.content.size()));
  w.Key("savedContent");
  w.String(p.savedContent.c_str(),
           static_cast<rapidjson::SizeType>(p.savedContent.size()));
  w.Key("isDirty");       w.Bool(p.isDirty);
  w.Key("workspaceRoot"); writeNullableString(w, p.workspaceRoot);
  w.EndObject();

  return std::string(sb.GetString(), sb.GetSize());
}

bool decodeTransferPayload(const std::string& json, TransferPayload& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str(), json.size());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  TransferPayload p;
  if (!readString(doc, "tabId", p.tabId) || p.tabId.empty()) return false;

  // Optional fields keep their defaults when absent; a wrong type rejects.
  if (doc.HasMember("title") && !readString(doc, "title", p.title)) return false;
  if (doc.HasMember("filePath") && !readString(doc, "filePath", p.filePath)) return false;
  if (doc.HasMember("content") && !readString(doc, "content", p.content)) return false;
  if (doc.HasMember("savedContent") &&
      !readString(doc, "savedContent", p.savedContent)) return false;
  if (doc.HasMember("workspaceRoot") &&
      !readString(doc, "workspaceRoot", p.workspaceRoot)) return false;

  if (doc.HasMember("isDirty")) {
    if (!doc["isDirty"].IsBool()) return false;
    p.isDirty = doc["isDirty"].GetBool();
  }

  out = std::move(p);
  return true;
}

bool operator==(const TransferPayload& a, const TransferPayload& b) {
  return a.tabId == b.tabId && a.title == b.title && a.filePath == b.filePath &&
         a.content == b.content && a.savedContent == b.savedContent &&
         a.isDirty == b.isDirty && a.workspaceRoot == b.workspaceRoot;
}

} // namespace dt
