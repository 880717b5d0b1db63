#include "internal/network/manual_network_monitor.hpp"

namespace stockcount::network {

ManualNetworkMonitor::ManualNetworkMonitor(bool online) : online_(online) {
}

bool ManualNetworkMonitor::IsOnline() const {
  return online_.load();
}

Subscription ManualNetworkMonitor::Subscribe(Listener listener) {
  return listeners_.Add(std::move(listener));
}

void ManualNetworkMonitor::SetOnline(bool online) {
  if (online_.exchange(online) == online) {
    return;
  }
  listeners_.Notify(online);
}

} // namespace stockcount::network
