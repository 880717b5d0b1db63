#pragma once

#include <grpcpp/channel.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/network/network_monitor.hpp"

namespace stockcount::network {

/*
  Derives connectivity from a gRPC channel.

  READY counts as online; TRANSIENT_FAILURE and SHUTDOWN as offline.
  IDLE and CONNECTING keep the last known value. Listeners run on the
  watcher thread.
*/
class ChannelNetworkMonitor final : public NetworkMonitor {
 public:
  ChannelNetworkMonitor(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds poll_interval);
  ~ChannelNetworkMonitor();

  ChannelNetworkMonitor(const ChannelNetworkMonitor&)            = delete;
  ChannelNetworkMonitor& operator=(const ChannelNetworkMonitor&) = delete;

  bool         IsOnline() const override;
  Subscription Subscribe(Listener listener) override;

  void Start();
  void Stop();

 private:
  void Run();
  void Observe(grpc_connectivity_state state);

  std::shared_ptr<::grpc::Channel> channel_;
  std::chrono::milliseconds        poll_interval_;

  std::atomic<bool> online_{false};
  ListenerSet       listeners_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              mutex_;
  std::condition_variable cv_;
};

} // namespace stockcount::network
