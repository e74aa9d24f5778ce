#include "dt/host/LocalWindowHost.hpp"

#include <cstddef>
#include <cstdio>
#include <utility>

namespace dt {

static constexpr double kSpawnOffsetPx = 32.0;

LocalWindowHost::LocalWindowHost(MessageBus& bus, TimerQueue& timers)
  : bus_(bus), timers_(timers) {}

LocalWindowHost::~LocalWindowHost() {
  if (platform_) {
    for (auto& s : windows_) platform_->destroyNativeWindow(s.window->label());
  }
}

void LocalWindowHost::setConfig(const DragConfig& cfg) {
  config_ = cfg;
  for (auto& s : windows_) s.window->drag().setConfig(cfg);
}

int LocalWindowHost::findSlot(const WindowLabel& label) const {
  for (std::size_t i = 0; i < windows_.size(); ++i) {
    if (windows_[i].window->label() == label) return static_cast<int>(i);
  }
  return -1;
}

DocumentWindow* LocalWindowHost::openWindow(const WindowLabel& label,
                                            const WindowBounds& bounds) {
  if (label.empty() || findSlot(label) >= 0) {
    std::fprintf(stderr, "[LocalWindowHost] window '%s' already exists\n", label.c_str());
    return nullptr;
  }
  if (platform_ && !platform_->createNativeWindow(label, bounds, label)) {
    std::fprintf(stderr, "[LocalWindowHost] native window '%s' failed\n", label.c_str());
    return nullptr;
  }

  Slot slot;
  slot.window = std::make_unique<DocumentWindow>(
      label, label == config_.primaryWindow, bounds, *this, bus_, timers_, config_);
  DocumentWindow* w = slot.window.get();
  windows_.insert(windows_.begin(), std::move(slot));
  return w;
}

DocumentWindow* LocalWindowHost::window(const WindowLabel& label) {
  int i = findSlot(label);
  return i < 0 ? nullptr : windows_[i].window.get();
}

const DocumentWindow* LocalWindowHost::window(const WindowLabel& label) const {
  int i = findSlot(label);
  return i < 0 ? nullptr : windows_[i].window.get();
}

std::vector<WindowLabel> LocalWindowHost::windowLabels() const {
  std::vector<WindowLabel> out;
  for (const auto& s : windows_) {
    if (!s.closing) out.push_back(s.window->label());
  }
  return out;
}

WindowLabel LocalWindowHost::focusedWindow() const {
  for (const auto& s : windows_) {
    if (!s.closing) return s.window->label();
  }
  return {};
}

bool LocalWindowHost::isClosing(const WindowLabel& label) const {
  int i = findSlot(label);
  return i >= 0 && windows_[i].closing;
}

void LocalWindowHost::refreshBounds(Slot& slot) {
  if (!platform_) return;
  WindowBounds b;
  if (platform_->queryBounds(slot.window->label(), b)) slot.window->setBounds(b);
}

HostResult LocalWindowHost::findWindowUnderPoint(double screenX, double screenY,
                                                 const WindowLabel& excluding) {
  for (auto& s : windows_) {
    if (s.closing || s.window->label() == excluding) continue;
    refreshBounds(s);
    if (s.window->bounds().contains(screenX, screenY)) return hostOk(s.window->label());
  }
  return hostOk();
}

HostResult LocalWindowHost::injectTabIntoWindow(const WindowLabel& label,
                                                const TransferPayload& payload) {
  int i = findSlot(label);
  if (i < 0 || windows_[i].closing) {
    return hostFail("WINDOW_GONE", "window '" + label + "' is not open");
  }

  TransferPayload received;
  if (!decodeTransferPayload(encodeTransferPayload(payload), received)) {
    return hostFail("BAD_PAYLOAD", "transfer payload rejected by " + label);
  }

  HostResult r = windows_[i].window->receiveTransfer(received);
  if (!r.ok) return r;

  HostResult f = focusWindow(label);
  if (!f.ok) {
    std::fprintf(stderr, "[LocalWindowHost] inject: %s\n", f.err.message.c_str());
  }
  return hostOk(label);
}

WindowLabel LocalWindowHost::nextSpawnLabel() {
  WindowLabel label;
  do {
    label = "doc-" + std::to_string(spawnSerial_++);
  } while (findSlot(label) >= 0);
  return label;
}

HostResult LocalWindowHost::spawnWindowWithTab(const TransferPayload& payload) {
  if (payload.tabId.empty()) {
    return hostFail("BAD_PAYLOAD", "transfer payload has no tab id");
  }

  WindowBounds bounds;
  WindowLabel top = focusedWindow();
  if (!top.empty()) {
    bounds = window(top)->bounds();
    bounds.x += kSpawnOffsetPx;
    bounds.y += kSpawnOffsetPx;
  }

  WindowLabel label = nextSpawnLabel();
  if (!openWindow(label, bounds)) {
    return hostFail("SPAWN_FAILED", "could not create window for tab '" + payload.tabId + "'");
  }
  pendingTransfers_[label] = encodeTransferPayload(payload);
  if (platform_ && !platform_->focusNativeWindow(label)) {
    std::fprintf(stderr, "[LocalWindowHost] could not focus new window '%s'\n", label.c_str());
  }
  return hostOk(label);
}

void LocalWindowHost::claimPendingTransfers() {
  auto pending = std::move(pendingTransfers_);
  pendingTransfers_.clear();
  for (auto& [label, json] : pending) {
    int i = findSlot(label);
    if (i < 0 || windows_[i].closing) continue;

    TransferPayload payload;
    if (!decodeTransferPayload(json, payload)) {
      std::fprintf(stderr, "[LocalWindowHost] '%s' got an unreadable seed transfer\n",
                   label.c_str());
      continue;
    }
    HostResult r = windows_[i].window->receiveTransfer(payload);
    if (!r.ok) {
      std::fprintf(stderr, "[LocalWindowHost] '%s' could not claim transfer: %s\n",
                   label.c_str(), r.err.message.c_str());
    }
  }
}

HostResult LocalWindowHost::removeTabFromWindow(const WindowLabel& label,
                                                const TabId& tabId) {
  int i = findSlot(label);
  if (i < 0 || windows_[i].closing) {
    return hostFail("WINDOW_GONE", "window '" + label + "' is not open");
  }
  DocumentWindow& w = *windows_[i].window;

  // A spawned window may not have claimed its seed yet.
  auto pit = pendingTransfers_.find(label);
  TransferPayload seed;
  if (pit != pendingTransfers_.end() && decodeTransferPayload(pit->second, seed) &&
      seed.tabId == tabId) {
    pendingTransfers_.erase(pit);
  } else {
    HostResult r = w.removeTab(tabId);
    if (!r.ok) return r;
  }

  bool seedPending = pendingTransfers_.count(label) > 0;
  if (!w.isPrimary() && w.tabs().count() == 0 && !seedPending) {
    windows_[i].closing = true;
  }
  return hostOk(label);
}

HostResult LocalWindowHost::focusWindow(const WindowLabel& label) {
  int i = findSlot(label);
  if (i < 0 || windows_[i].closing) {
    return hostFail("WINDOW_GONE", "window '" + label + "' is not open");
  }
  if (platform_ && !platform_->focusNativeWindow(label)) {
    return hostFail("NATIVE_FAILED", "could not focus '" + label + "'");
  }
  if (i > 0) {
    Slot s = std::move(windows_[i]);
    windows_.erase(windows_.begin() + i);
    windows_.insert(windows_.begin(), std::move(s));
  }
  return hostOk(label);
}

HostResult LocalWindowHost::closeWindow(const WindowLabel& label) {
  int i = findSlot(label);
  if (i < 0) return hostFail("WINDOW_GONE", "window '" + label + "' is not open");
  windows_[i].closing = true;
  return hostOk(label);
}

std::size_t LocalWindowHost::pump() {
  claimPendingTransfers();

  std::size_t destroyed = 0;
  for (std::size_t i = 0; i < windows_.size();) {
    if (!windows_[i].closing) {
      ++i;
      continue;
    }
    WindowLabel label = windows_[i].window->label();
    pendingTransfers_.erase(label);
    windows_.erase(windows_.begin() + static_cast<std::ptrdiff_t>(i));
    if (platform_) platform_->destroyNativeWindow(label);
    ++destroyed;
  }
  return destroyed;
}

} // namespace dt
