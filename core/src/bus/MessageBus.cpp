#include "dt/bus/MessageBus.hpp"

#include <algorithm>

namespace dt {

Subscription& Subscription::operator=(Subscription&& o) noexcept {
  if (this != &o) {
    unsubscribe();
    bus_ = o.bus_;
    token_ = o.token_;
    o.bus_ = nullptr;
    o.token_ = 0;
  }
  return *this;
}

void Subscription::unsubscribe() {
  if (bus_) {
    bus_->unsubscribe(token_);
    bus_ = nullptr;
    token_ = 0;
  }
}

void LocalMessageBus::broadcast(const std::string& event,
                                const std::string& payloadJson) {
  mailbox_.push(Message{event, payloadJson});
}

Subscription LocalMessageBus::subscribe(const std::string& event,
                                        BusHandler handler) {
  std::lock_guard<std::mutex> lock(mtx_);
  std::uint64_t token = nextToken_++;
  handlers_[token] = Entry{event, std::move(handler)};
  return Subscription(this, token);
}

void LocalMessageBus::unsubscribe(std::uint64_t token) {
  std::lock_guard<std::mutex> lock(mtx_);
  handlers_.erase(token);
}

std::size_t LocalMessageBus::subscriberCount(const std::string& event) const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::size_t n = 0;
  for (const auto& kv : handlers_) {
    if (kv.second.event == event) n++;
  }
  return n;
}

std::size_t LocalMessageBus::dispatchPending() {
  std::size_t delivered = 0;
  std::vector<Message> batch;

  while (mailbox_.drainTo(batch) > 0) {
    for (const auto& msg : batch) {
      std::vector<std::uint64_t> tokens;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        for (const auto& kv : handlers_) {
          if (kv.second.event == msg.event) tokens.push_back(kv.first);
        }
      }
      // Subscription order, so delivery is deterministic.
      std::sort(tokens.begin(), tokens.end());

      for (std::uint64_t token : tokens) {
        BusHandler handler;
        {
          std::lock_guard<std::mutex> lock(mtx_);
          auto it = handlers_.find(token);
          if (it == handlers_.end()) continue;  // unsubscribed mid-dispatch
          handler = it->second.handler;
        }
        handler(msg.payload);
      }
      delivered++;
    }
    batch.clear();
  }
  return delivered;
}

} // namespace dt
