#include "dt/drop/DropPreview.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

#include <cstdio>
#include <utility>

namespace dt {

std::string encodeDropPreview(const DropPreviewEvent& ev) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();
  w.Key("sourceWindowLabel");
  w.String(ev.sourceWindow.c_str(),
           static_cast<rapidjson::SizeType>(ev.sourceWindow.size()));
  w.Key("targetWindowLabel");
  if (ev.targetWindow.empty()) {
    w.Null();
  } else {
    w.String(ev.targetWindow.c_str(),
             static_cast<rapidjson::SizeType>(ev.targetWindow.size()));
  }
  w.EndObject();

  return std::string(sb.GetString(), sb.GetSize());
}

bool decodeDropPreview(const std::string& json, DropPreviewEvent& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str(), json.size());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  auto src = doc.FindMember("sourceWindowLabel");
  if (src == doc.MemberEnd() || !src->value.IsString()) return false;

  DropPreviewEvent ev;
  ev.sourceWindow = src->value.GetString();

  auto tgt = doc.FindMember("targetWindowLabel");
  if (tgt != doc.MemberEnd()) {
    if (tgt->value.IsString()) {
      ev.targetWindow = tgt->value.GetString();
    } else if (!tgt->value.IsNull()) {
      return false;
    }
  }

  out = std::move(ev);
  return true;
}

DropPreviewListener::DropPreviewListener(MessageBus& bus, WindowLabel self)
  : self_(std::move(self)) {
  sub_ = bus.subscribe(kDropPreviewEvent,
                       [this](const std::string& payload) { onMessage(payload); });
}

void DropPreviewListener::onMessage(const std::string& payloadJson) {
  DropPreviewEvent ev;
  if (!decodeDropPreview(payloadJson, ev)) {
    std::fprintf(stderr, "[DropPreviewListener] %s: ignoring malformed preview\n",
                 self_.c_str());
    return;
  }
  // A window never previews a drop of its own tab onto itself.
  if (ev.sourceWindow == self_) return;

  lastSource_ = ev.sourceWindow;
  isTarget_ = ev.targetWindow == self_;
}

} // namespace dt
