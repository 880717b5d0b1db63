#include "internal/network/network_monitor.hpp"

#include <vector>

namespace stockcount::network {

Subscription::~Subscription() {
  Reset();
}

Subscription::Subscription(Subscription&& other) noexcept : registry_(std::move(other.registry_)), id_(other.id_) {
  other.registry_.reset();
  other.id_ = 0;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
  if (this != &other) {
    Reset();
    registry_ = std::move(other.registry_);
    id_       = other.id_;
    other.registry_.reset();
    other.id_ = 0;
  }
  return *this;
}

void Subscription::Reset() {
  if (auto registry = registry_.lock()) {
    std::scoped_lock lock(registry->mutex);
    registry->listeners.erase(id_);
  }
  registry_.reset();
  id_ = 0;
}

ListenerSet::ListenerSet() : registry_(std::make_shared<Subscription::Registry>()) {
}

Subscription ListenerSet::Add(Listener listener) {
  std::scoped_lock lock(registry_->mutex);
  const uint64_t   id = registry_->next_id++;
  registry_->listeners.emplace(id, std::move(listener));
  return Subscription(registry_, id);
}

void ListenerSet::Notify(bool online) const {
  std::vector<Listener> snapshot;
  {
    std::scoped_lock lock(registry_->mutex);
    snapshot.reserve(registry_->listeners.size());
    for (const auto& [_, listener] : registry_->listeners) {
      snapshot.push_back(listener);
    }
  }
  for (const auto& listener : snapshot) {
    listener(online);
  }
}

} // namespace stockcount::network
