#pragma once
#include "dt/bus/Mailbox.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace dt {

class MessageBus;

using BusHandler = std::function<void(const std::string& payloadJson)>;

// Move-only handle; delivery stops when it is reset or destroyed.
// The bus must outlive every subscription taken from it.
class Subscription {
public:
  Subscription() = default;
  Subscription(MessageBus* bus, std::uint64_t token) : bus_(bus), token_(token) {}
  ~Subscription() { unsubscribe(); }

  Subscription(Subscription&& o) noexcept : bus_(o.bus_), token_(o.token_) {
    o.bus_ = nullptr;
    o.token_ = 0;
  }
  Subscription& operator=(Subscription&& o) noexcept;

  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;

  void unsubscribe();
  bool active() const { return bus_ != nullptr; }

private:
  MessageBus* bus_{nullptr};
  std::uint64_t token_{0};
};

// Cross-window publish/subscribe. Windows share no memory; every piece of
// shared drag state travels through here as a JSON payload.
class MessageBus {
public:
  virtual ~MessageBus() = default;

  virtual void broadcast(const std::string& event, const std::string& payloadJson) = 0;
  virtual Subscription subscribe(const std::string& event, BusHandler handler) = 0;

protected:
  friend class Subscription;
  virtual void unsubscribe(std::uint64_t token) = 0;
};

// In-process bus. broadcast() may be called from any thread; handlers run
// on the thread that calls dispatchPending() (the UI loop).
class LocalMessageBus : public MessageBus {
public:
  explicit LocalMessageBus(std::size_t mailboxCapacity = 1024)
    : mailbox_(mailboxCapacity) {}

  void broadcast(const std::string& event, const std::string& payloadJson) override;
  Subscription subscribe(const std::string& event, BusHandler handler) override;

  // Delivers every queued message, including ones broadcast by handlers
  // during this call. Returns the number of messages delivered.
  std::size_t dispatchPending();

  std::size_t queued() const { return mailbox_.size(); }
  std::size_t subscriberCount(const std::string& event) const;

protected:
  void unsubscribe(std::uint64_t token) override;

private:
  struct Message {
    std::string event;
    std::string payload;
  };
  struct Entry {
    std::string event;
    BusHandler handler;
  };

  Mailbox<Message> mailbox_;
  mutable std::mutex mtx_;
  std::unordered_map<std::uint64_t, Entry> handlers_;
  std::uint64_t nextToken_{1};
};

} // namespace dt
