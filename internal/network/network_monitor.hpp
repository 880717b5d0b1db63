#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace stockcount::network {

using Listener = std::function<void(bool online)>;

/*
  Registration handle. Dropping it unsubscribes.
  Safe to outlive the monitor that issued it.
*/
class Subscription {
 public:
  Subscription() = default;
  ~Subscription();

  Subscription(Subscription&& other) noexcept;
  Subscription& operator=(Subscription&& other) noexcept;

  Subscription(const Subscription&)            = delete;
  Subscription& operator=(const Subscription&) = delete;

  void Reset();

  bool Active() const {
    return !registry_.expired();
  }

 private:
  friend class ListenerSet;

  struct Registry {
    std::mutex                    mutex;
    std::map<uint64_t, Listener>  listeners;
    uint64_t                      next_id = 1;
  };

  Subscription(std::weak_ptr<Registry> registry, uint64_t id) : registry_(std::move(registry)), id_(id) {
  }

  std::weak_ptr<Registry> registry_;
  uint64_t                id_ = 0;
};

/*
  Listener bookkeeping shared by monitor implementations.
  Notify() invokes listeners outside the lock, in subscription order.
*/
class ListenerSet {
 public:
  ListenerSet();

  Subscription Add(Listener listener);
  void         Notify(bool online) const;

 private:
  std::shared_ptr<Subscription::Registry> registry_;
};

/*
  Connectivity port.

  Listeners fire only on transitions, possibly from a background thread.
*/
class NetworkMonitor {
 public:
  virtual ~NetworkMonitor() = default;

  virtual bool IsOnline() const = 0;

  virtual Subscription Subscribe(Listener listener) = 0;
};

} // namespace stockcount::network
