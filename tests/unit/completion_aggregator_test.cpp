#include "internal/session/completion_aggregator.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "test_fakes.hpp"

namespace {

using stockcount::db::memory::MemoryRepository;
using stockcount::model::ItemStatus;
using stockcount::model::QuantityBand;
using stockcount::model::SessionItemUpdate;
using stockcount::session::BandIndex;
using stockcount::session::ClassifyQuantity;
using stockcount::session::CompletionAggregator;
using stockcount::session::ReorderUrgency;
using stockcount::testing::FakeClock;
using stockcount::testing::MakeItem;
using stockcount::testing::RecordingNotifications;

SessionItemUpdate Counted(const std::string& id, double previous, double now) {
  SessionItemUpdate update;
  update.area_item_id      = id;
  update.previous_quantity = previous;
  update.new_quantity      = now;
  update.status            = ItemStatus::kCounted;
  return update;
}

SessionItemUpdate Skipped(const std::string& id, double previous) {
  SessionItemUpdate update;
  update.area_item_id      = id;
  update.previous_quantity = previous;
  update.new_quantity      = previous;
  update.status            = ItemStatus::kSkipped;
  return update;
}

struct Fixture {
  std::shared_ptr<MemoryRepository>       repository    = std::make_shared<MemoryRepository>();
  std::shared_ptr<RecordingNotifications> notifications = std::make_shared<RecordingNotifications>();
  CompletionAggregator                    aggregator{repository, notifications, std::make_shared<FakeClock>()};
};

void TestBandBoundaries() {
  assert(ClassifyQuantity(4.99, 5) == QuantityBand::kCritical);
  assert(ClassifyQuantity(5, 5) == QuantityBand::kLow);
  assert(ClassifyQuantity(7.49, 5) == QuantityBand::kLow);
  assert(ClassifyQuantity(7.5, 5) == QuantityBand::kHealthy);
  assert(ClassifyQuantity(0, 0) == QuantityBand::kHealthy);
  assert(ClassifyQuantity(2, 2, 2.0) == QuantityBand::kLow);
  assert(ClassifyQuantity(4, 2, 2.0) == QuantityBand::kHealthy);
}

void TestBandIndexTracksMoves() {
  BandIndex index;
  index.Set("A", QuantityBand::kHealthy);
  index.Set("B", QuantityBand::kCritical);
  assert(index.Count(QuantityBand::kHealthy) == 1);

  index.Set("A", QuantityBand::kCritical);
  assert(index.Count(QuantityBand::kHealthy) == 0);
  assert(index.Count(QuantityBand::kCritical) == 2);
  assert(index.Get("A") == QuantityBand::kCritical);
  assert(!index.Get("Z").has_value());

  index.Clear();
  assert(index.Count(QuantityBand::kCritical) == 0);
}

void TestSummaryPartitionsItems() {
  Fixture f;
  const std::vector items = {MakeItem("A", 10, 5, 20), MakeItem("B", 3, 5, 12), MakeItem("C", 8, 4), MakeItem("D", 5, 4)};

  std::map<std::string, SessionItemUpdate> updates;
  updates["A"] = Counted("A", 10, 10);
  updates["B"] = Counted("B", 3, 2);
  updates["C"] = Counted("C", 8, 8);
  updates["D"] = Skipped("D", 5);

  auto summary = f.aggregator.Summarize("s-1", "area-1", items, updates);

  assert(summary.critical.size() == 1);
  assert(summary.critical[0].area_item_id == "B");
  assert(summary.critical[0].quantity == 2);
  assert(summary.low.size() == 1);
  assert(summary.low[0].area_item_id == "D");
  assert(summary.low[0].status == ItemStatus::kSkipped);
  assert(summary.healthy.size() == 2);
  assert(summary.critical.size() + summary.low.size() + summary.healthy.size() == items.size());

  assert(summary.counted_count == 3);
  assert(summary.skipped_count == 1);
  assert(summary.total_quantity_changed == 1.0);
  assert(summary.updated_items_count == 1);

  assert(summary.reorder.size() == 1);
  assert(summary.reorder[0].inventory_item_id == "inv-B");
  assert(summary.reorder[0].reorder_quantity == 10);
  assert(summary.reorder[0].urgency == ReorderUrgency::kMedium);
}

void TestSkippedItemUsesPreviousQuantity() {
  Fixture f;
  // the queue copy already moved, the skip recorded the baseline
  const std::vector items = {MakeItem("A", 1, 5)};

  std::map<std::string, SessionItemUpdate> updates;
  updates["A"] = Skipped("A", 9);

  auto summary = f.aggregator.Summarize("s-1", "area-1", items, updates);
  assert(summary.healthy.size() == 1);
  assert(summary.healthy[0].quantity == 9);
}

void TestEmptyItemIsHighUrgency() {
  Fixture                                  f;
  std::map<std::string, SessionItemUpdate> updates;
  updates["A"] = Counted("A", 3, 0);

  auto summary = f.aggregator.Summarize("s-1", "area-1", {MakeItem("A", 3, 2, 1)}, updates);
  assert(summary.reorder.size() == 1);
  assert(summary.reorder[0].urgency == ReorderUrgency::kHigh);
  assert(summary.reorder[0].reorder_quantity == 1);
}

void TestCriticalAlertFiresOncePerSession() {
  Fixture                                  f;
  std::map<std::string, SessionItemUpdate> updates;
  updates["A"] = Counted("A", 3, 1);
  updates["B"] = Counted("B", 3, 0);

  auto summary = f.aggregator.Summarize("s-1", "area-1", {MakeItem("A", 3, 2), MakeItem("B", 3, 2)}, updates);
  assert(summary.critical.size() == 2);

  assert(f.aggregator.NotifyIfCritical(summary, "Bar"));
  assert(summary.alert_sent);

  auto replay = summary;
  replay.alert_sent = false;
  assert(!f.aggregator.NotifyIfCritical(replay, "Bar"));
  assert(replay.alert_sent);

  const auto alerts = f.notifications->Alerts();
  assert(alerts.size() == 1);
  assert(alerts[0].first == "Critical stock: Bar");
  assert(alerts[0].second == "2 items are below minimum");

  auto tx     = f.repository->Begin();
  auto record = f.repository->GetSessionAlert(*tx, "s-1");
  tx->Commit();
  assert(record.has_value());
  assert(record->critical_count == 2);
}

void TestFailedAlertLeavesNoRecord() {
  Fixture                                  f;
  std::map<std::string, SessionItemUpdate> updates;
  updates["A"] = Counted("A", 3, 1);

  auto summary = f.aggregator.Summarize("s-3", "area-1", {MakeItem("A", 3, 2)}, updates);

  f.notifications->Fail(true);
  assert(!f.aggregator.NotifyIfCritical(summary, "Bar"));
  assert(!summary.alert_sent);

  {
    auto tx = f.repository->Begin();
    assert(!f.repository->GetSessionAlert(*tx, "s-3").has_value());
    tx->Commit();
  }

  f.notifications->Fail(false);
  assert(f.aggregator.NotifyIfCritical(summary, "Bar"));
  assert(summary.alert_sent);
  assert(f.notifications->Alerts().size() == 1);
}

void TestNoAlertWithoutCriticalItems() {
  Fixture                                  f;
  std::map<std::string, SessionItemUpdate> updates;
  updates["A"] = Counted("A", 3, 30);

  auto summary = f.aggregator.Summarize("s-2", "area-1", {MakeItem("A", 3, 2)}, updates);
  assert(!f.aggregator.NotifyIfCritical(summary, "Bar"));
  assert(!summary.alert_sent);
  assert(f.notifications->Alerts().empty());
}

} // namespace

int main() {
  TestBandBoundaries();
  TestBandIndexTracksMoves();
  TestSummaryPartitionsItems();
  TestSkippedItemUsesPreviousQuantity();
  TestEmptyItemIsHighUrgency();
  TestCriticalAlertFiresOncePerSession();
  TestFailedAlertLeavesNoRecord();
  TestNoAlertWithoutCriticalItems();

  std::cout << "stockcount_unit_completion_aggregator: pass\n";
  return 0;
}
