#pragma once

#include <atomic>

#include "internal/network/network_monitor.hpp"

namespace stockcount::network {

/*
  Connectivity driven by the caller (tests, the stockctl "online"/"offline"
  commands). Listeners run synchronously on the thread calling SetOnline().
*/
class ManualNetworkMonitor final : public NetworkMonitor {
 public:
  explicit ManualNetworkMonitor(bool online = true);

  bool         IsOnline() const override;
  Subscription Subscribe(Listener listener) override;

  // Fires listeners only when the value changes.
  void SetOnline(bool online);

 private:
  std::atomic<bool> online_;
  ListenerSet       listeners_;
};

} // namespace stockcount::network
