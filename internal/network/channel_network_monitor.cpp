#include "internal/network/channel_network_monitor.hpp"

#include "internal/observability/logging.hpp"

namespace stockcount::network {

ChannelNetworkMonitor::ChannelNetworkMonitor(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds poll_interval)
    : channel_(std::move(channel)), poll_interval_(poll_interval) {
}

ChannelNetworkMonitor::~ChannelNetworkMonitor() {
  Stop();
}

bool ChannelNetworkMonitor::IsOnline() const {
  return online_.load();
}

Subscription ChannelNetworkMonitor::Subscribe(Listener listener) {
  return listeners_.Add(std::move(listener));
}

void ChannelNetworkMonitor::Start() {
  if (running_.exchange(true)) {
    return;
  }
  Observe(channel_->GetState(true));
  thread_ = std::thread(&ChannelNetworkMonitor::Run, this);
}

void ChannelNetworkMonitor::Stop() {
  {
    std::scoped_lock lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void ChannelNetworkMonitor::Run() {
  while (running_) {
    const auto state = channel_->GetState(true);

    // returns early on a state change, otherwise after one poll interval
    channel_->WaitForStateChange(state, std::chrono::system_clock::now() + poll_interval_);
    if (!running_) {
      break;
    }
    Observe(channel_->GetState(false));

    // a failed channel reports TRANSIENT_FAILURE at once; pace reconnect probes
    if (!online_) {
      std::unique_lock lock(mutex_);
      cv_.wait_for(lock, poll_interval_, [this] { return !running_; });
    }
  }
}

void ChannelNetworkMonitor::Observe(grpc_connectivity_state state) {
  bool online = false;
  switch (state) {
    case GRPC_CHANNEL_READY:
      online = true;
      break;
    case GRPC_CHANNEL_TRANSIENT_FAILURE:
    case GRPC_CHANNEL_SHUTDOWN:
      online = false;
      break;
    default:
      return;
  }

  if (online_.exchange(online) == online) {
    return;
  }
  STOCKCOUNT_LOG_INFO("connectivity changed", {observability::BoolField("online", online)});
  listeners_.Notify(online);
}

} // namespace stockcount::network
