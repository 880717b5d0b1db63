#include "internal/session/pending_update_queue.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "test_fakes.hpp"

namespace {

using stockcount::db::memory::MemoryRepository;
using stockcount::remote::RemoteError;
using stockcount::session::DrainReport;
using stockcount::session::PendingUpdateQueue;
using stockcount::testing::FakeClock;
using stockcount::testing::FakeInventory;

namespace v1 = stockcount::v1;

v1::PendingPayload ItemWrite(const std::string& item_id, double quantity) {
  v1::PendingPayload payload;
  auto*              write = payload.mutable_item_write();
  write->set_session_id("session-1");
  write->set_area_id("area-1");
  write->set_area_item_id(item_id);
  write->set_new_quantity(quantity);
  return payload;
}

struct Fixture {
  std::shared_ptr<MemoryRepository> repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<FakeClock>        clock      = std::make_shared<FakeClock>();
  FakeInventory                     inventory;
  PendingUpdateQueue                queue{repository, clock};
};

void TestDrainSendsInOrderAndEmptiesQueue() {
  Fixture f;
  f.queue.Enqueue("session-1", "A", ItemWrite("A", 1));
  f.clock->Advance(std::chrono::milliseconds(5));
  f.queue.Enqueue("session-1", "B", ItemWrite("B", 2));
  f.queue.Enqueue("session-1", "C", ItemWrite("C", 3));
  assert(f.queue.Size() == 3);
  assert(!f.queue.LastSyncAt().has_value());

  auto report = f.queue.Drain(f.inventory);
  assert(report.acknowledged == 3);
  assert(report.failed == 0);
  assert(f.queue.Size() == 0);
  assert(f.queue.LastSyncAt().has_value());

  const auto writes = f.inventory.Writes();
  assert(writes.size() == 3);
  assert(writes[0].area_item_id() == "A");
  assert(writes[1].area_item_id() == "B");
  assert(writes[2].area_item_id() == "C");

  auto tx = f.repository->Begin();
  assert(f.repository->ListPendingUpdates(*tx).empty());
  tx->Commit();
}

void TestFailureKeepsEntryAtFrontAndCountsAttempts() {
  Fixture f;
  const auto first = f.queue.Enqueue("session-1", "A", ItemWrite("A", 1));
  f.queue.Enqueue("session-1", "B", ItemWrite("B", 2));

  f.inventory.FailWith(RemoteError::Unavailable);
  auto report = f.queue.Drain(f.inventory);
  assert(report.acknowledged == 0);
  assert(report.failed == 1);
  assert(report.last_error.code == RemoteError::Unavailable);

  report = f.queue.Drain(f.inventory);
  assert(report.failed == 1);

  auto snapshot = f.queue.Snapshot();
  assert(snapshot.size() == 2);
  assert(snapshot[0].id == first);
  assert(snapshot[0].attempts == 2);
  assert(snapshot[1].attempts == 0);

  // attempts are durable
  auto tx      = f.repository->Begin();
  auto records = f.repository->ListPendingUpdates(*tx);
  tx->Commit();
  assert(records.size() == 2);
  assert(records[0].id == first);
  assert(records[0].attempts == 2);

  f.inventory.FailWith(std::nullopt);
  report = f.queue.Drain(f.inventory);
  assert(report.acknowledged == 2);
  assert(f.queue.Size() == 0);
}

void TestSizeDecreasesByOnePerAcknowledgment() {
  Fixture                  f;
  std::vector<std::size_t> sizes;
  f.queue.SetSizeListener([&](std::size_t size) { sizes.push_back(size); });

  f.queue.Enqueue("session-1", "A", ItemWrite("A", 1));
  f.queue.Enqueue("session-1", "B", ItemWrite("B", 1));
  f.queue.Enqueue("session-1", "C", ItemWrite("C", 1));
  f.queue.Drain(f.inventory);

  assert((sizes == std::vector<std::size_t>{1, 2, 3, 2, 1, 0}));
}

void TestEnqueueCoalescesSameItem() {
  Fixture    f;
  const auto first  = f.queue.Enqueue("session-1", "A", ItemWrite("A", 1));
  const auto second = f.queue.Enqueue("session-1", "A", ItemWrite("A", 7));
  assert(first == second);
  assert(f.queue.Size() == 1);
  assert(f.queue.Snapshot()[0].payload.item_write().new_quantity() == 7);

  // different session or kind is a separate entry
  f.queue.Enqueue("session-2", "A", ItemWrite("A", 1));
  v1::PendingPayload commit;
  commit.mutable_session_commit()->set_session_id("session-1");
  f.queue.Enqueue("session-1", "A", commit);
  assert(f.queue.Size() == 3);
}

void TestEmptyPayloadIsRejected() {
  Fixture f;
  bool    threw = false;
  try {
    f.queue.Enqueue("session-1", "A", v1::PendingPayload{});
  } catch (const stockcount::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(f.queue.Size() == 0);
}

void TestHydrateRestoresPersistedQueue() {
  Fixture f;
  f.queue.Enqueue("session-1", "A", ItemWrite("A", 1));
  f.clock->Advance(std::chrono::milliseconds(1));
  f.queue.Enqueue("session-1", "B", ItemWrite("B", 2));

  PendingUpdateQueue reloaded(f.repository, f.clock);
  reloaded.Hydrate();
  assert(reloaded.Size() == 2);

  auto snapshot = reloaded.Snapshot();
  assert(snapshot[0].area_item_id == "A");
  assert(snapshot[1].area_item_id == "B");
  assert(snapshot[1].payload.item_write().new_quantity() == 2);

  // new entries continue the sequence
  reloaded.Enqueue("session-1", "C", ItemWrite("C", 3));
  snapshot = reloaded.Snapshot();
  assert(snapshot[2].sequence > snapshot[1].sequence);
}

void TestAbandonRemovesWithoutSending() {
  Fixture    f;
  const auto id = f.queue.Enqueue("session-1", "A", ItemWrite("A", 1));
  assert(f.queue.Abandon(id));
  assert(!f.queue.Abandon(id));
  assert(f.queue.Size() == 0);

  f.queue.Drain(f.inventory);
  assert(f.inventory.Writes().empty());
}

void TestConcurrentDrainIsSingleFlight() {
  Fixture f;
  f.queue.Enqueue("session-1", "A", ItemWrite("A", 1));

  f.inventory.Hold();
  std::thread drainer([&] { f.queue.Drain(f.inventory); });
  f.inventory.WaitUntilHeld();

  assert(f.queue.Draining());
  auto second = f.queue.Drain(f.inventory);
  assert(second.skipped);
  assert(second.acknowledged == 0);

  // arrives mid-drain; the running drain picks it up
  f.queue.Enqueue("session-1", "B", ItemWrite("B", 2));

  f.inventory.Release();
  drainer.join();

  assert(f.queue.Size() == 0);
  assert(!f.queue.Draining());
  assert(f.inventory.MaxInFlight() == 1);
  assert(f.inventory.Writes().size() == 2);
}

void TestReplacedInFlightEntryIsResent() {
  Fixture    f;
  const auto id = f.queue.Enqueue("session-1", "A", ItemWrite("A", 1));

  DrainReport report;
  f.inventory.Hold();
  std::thread drainer([&] { report = f.queue.Drain(f.inventory); });
  f.inventory.WaitUntilHeld();

  // the acknowledgment of quantity 1 must not drop quantity 9
  assert(f.queue.Enqueue("session-1", "A", ItemWrite("A", 9)) == id);

  f.inventory.Release();
  drainer.join();

  const auto writes = f.inventory.Writes();
  assert(writes.size() == 2);
  assert(writes[0].new_quantity() == 1);
  assert(writes[1].new_quantity() == 9);
  assert(f.queue.Size() == 0);

  // one entry left the queue; the first send only counts as superseded
  assert(report.acknowledged == 1);
  assert(report.superseded == 1);
  assert(report.failed == 0);
}

} // namespace

int main() {
  TestDrainSendsInOrderAndEmptiesQueue();
  TestFailureKeepsEntryAtFrontAndCountsAttempts();
  TestSizeDecreasesByOnePerAcknowledgment();
  TestEnqueueCoalescesSameItem();
  TestEmptyPayloadIsRejected();
  TestHydrateRestoresPersistedQueue();
  TestAbandonRemovesWithoutSending();
  TestConcurrentDrainIsSingleFlight();
  TestReplacedInFlightEntryIsResent();

  std::cout << "stockcount_unit_pending_update_queue: pass\n";
  return 0;
}
