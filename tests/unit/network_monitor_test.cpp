#include "internal/network/manual_network_monitor.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <vector>

namespace {

using stockcount::network::ManualNetworkMonitor;
using stockcount::network::Subscription;

void TestListenersFireOnTransitionsOnly() {
  ManualNetworkMonitor monitor(true);
  std::vector<bool>    seen;
  auto                 sub = monitor.Subscribe([&](bool online) { seen.push_back(online); });

  monitor.SetOnline(true);
  monitor.SetOnline(false);
  monitor.SetOnline(false);
  monitor.SetOnline(true);

  assert((seen == std::vector<bool>{false, true}));
  assert(monitor.IsOnline());
}

void TestDroppingSubscriptionUnsubscribes() {
  ManualNetworkMonitor monitor(false);
  int                  calls = 0;
  {
    auto sub = monitor.Subscribe([&](bool) { ++calls; });
    assert(sub.Active());
    monitor.SetOnline(true);
  }
  monitor.SetOnline(false);
  assert(calls == 1);

  auto sub = monitor.Subscribe([&](bool) { ++calls; });
  sub.Reset();
  assert(!sub.Active());
  monitor.SetOnline(true);
  assert(calls == 1);
}

void TestSubscriptionMayOutliveMonitor() {
  Subscription sub;
  {
    auto monitor = std::make_unique<ManualNetworkMonitor>();
    sub          = monitor->Subscribe([](bool) {});
    assert(sub.Active());
  }
  assert(!sub.Active());
  sub.Reset();
}

void TestMovedSubscriptionKeepsListener() {
  ManualNetworkMonitor monitor(true);
  int                  calls = 0;

  Subscription outer;
  {
    auto inner = monitor.Subscribe([&](bool) { ++calls; });
    outer      = std::move(inner);
  }
  monitor.SetOnline(false);
  assert(calls == 1);
}

} // namespace

int main() {
  TestListenersFireOnTransitionsOnly();
  TestDroppingSubscriptionUnsubscribes();
  TestSubscriptionMayOutliveMonitor();
  TestMovedSubscriptionKeepsListener();

  std::cout << "stockcount_unit_network_monitor: pass\n";
  return 0;
}
