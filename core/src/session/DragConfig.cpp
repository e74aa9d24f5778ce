#include "dt/session/DragConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace dt {

namespace {

bool readInt(const rapidjson::Value& obj, const char* key, int& out) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsInt()) return false;
  out = it->value.GetInt();
  return true;
}

bool readDouble(const rapidjson::Value& obj, const char* key, double& out) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsNumber()) return false;
  out = it->value.GetDouble();
  return true;
}

bool readBool(const rapidjson::Value& obj, const char* key, bool& out) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsBool()) return false;
  out = it->value.GetBool();
  return true;
}

// Absent sections are fine; a present section must be an object.
const rapidjson::Value* section(const rapidjson::Value& doc, const char* key,
                                bool& ok) {
  auto it = doc.FindMember(key);
  if (it == doc.MemberEnd()) return nullptr;
  if (!it->value.IsObject()) ok = false;
  return ok ? &it->value : nullptr;
}

} // namespace

std::string serializeDragConfig(const DragConfig& cfg) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  rapidjson::Value gesture(rapidjson::kObjectType);
  gesture.AddMember("holdDelayMs", cfg.gesture.holdDelayMs, alloc);
  gesture.AddMember("holdCancelRadiusPx", cfg.gesture.holdCancelRadiusPx, alloc);
  gesture.AddMember("dragOutMarginPx", cfg.gesture.dragOutMarginPx, alloc);
  gesture.AddMember("reorderLockPx", cfg.gesture.reorderLockPx, alloc);
  doc.AddMember("gesture", gesture, alloc);

  rapidjson::Value scroll(rapidjson::kObjectType);
  scroll.AddMember("edgeMarginPx", cfg.autoScroll.edgeMarginPx, alloc);
  scroll.AddMember("maxStepPx", cfg.autoScroll.maxStepPx, alloc);
  scroll.AddMember("tickMs", cfg.autoScroll.tickMs, alloc);
  doc.AddMember("autoScroll", scroll, alloc);

  rapidjson::Value probe(rapidjson::kObjectType);
  probe.AddMember("debounceMs", cfg.probe.debounceMs, alloc);
  doc.AddMember("probe", probe, alloc);

  rapidjson::Value spring(rapidjson::kObjectType);
  spring.AddMember("dwellMs", cfg.springLoad.dwellMs, alloc);
  spring.AddMember("enabled", cfg.springLoad.enabled, alloc);
  doc.AddMember("springLoad", spring, alloc);

  rapidjson::Value feedback(rapidjson::kObjectType);
  feedback.AddMember("snapbackMs", cfg.feedback.snapbackMs, alloc);
  feedback.AddMember("announcementClearMs", cfg.feedback.announcementClearMs, alloc);
  doc.AddMember("feedback", feedback, alloc);

  doc.AddMember("primaryWindow",
                rapidjson::Value(cfg.primaryWindow.c_str(), alloc), alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

bool deserializeDragConfig(const std::string& json, DragConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  DragConfig cfg = out;
  bool ok = true;

  if (const auto* g = section(doc, "gesture", ok)) {
    ok = ok && readInt(*g, "holdDelayMs", cfg.gesture.holdDelayMs)
            && readDouble(*g, "holdCancelRadiusPx", cfg.gesture.holdCancelRadiusPx)
            && readDouble(*g, "dragOutMarginPx", cfg.gesture.dragOutMarginPx)
            && readDouble(*g, "reorderLockPx", cfg.gesture.reorderLockPx);
  }
  if (const auto* s = section(doc, "autoScroll", ok)) {
    ok = ok && readDouble(*s, "edgeMarginPx", cfg.autoScroll.edgeMarginPx)
            && readDouble(*s, "maxStepPx", cfg.autoScroll.maxStepPx)
            && readInt(*s, "tickMs", cfg.autoScroll.tickMs);
  }
  if (const auto* p = section(doc, "probe", ok)) {
    ok = ok && readInt(*p, "debounceMs", cfg.probe.debounceMs);
  }
  if (const auto* sl = section(doc, "springLoad", ok)) {
    ok = ok && readInt(*sl, "dwellMs", cfg.springLoad.dwellMs)
            && readBool(*sl, "enabled", cfg.springLoad.enabled);
  }
  if (const auto* f = section(doc, "feedback", ok)) {
    ok = ok && readInt(*f, "snapbackMs", cfg.feedback.snapbackMs)
            && readInt(*f, "announcementClearMs", cfg.feedback.announcementClearMs);
  }

  auto pw = doc.FindMember("primaryWindow");
  if (pw != doc.MemberEnd()) {
    if (pw->value.IsString() && pw->value.GetStringLength() > 0) {
      cfg.primaryWindow = pw->value.GetString();
    } else {
      ok = false;
    }
  }

  if (!ok) return false;
  out = cfg;
  return true;
}

} // namespace dt
