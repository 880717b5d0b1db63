#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/remote/inventory_service.hpp"
#include "internal/util/time.hpp"
#include "stockcount/v1.hpp"

namespace stockcount::session {

struct PendingUpdate {
  std::string id;
  uint64_t    sequence = 0;

  std::string area_item_id;
  std::string session_id;

  v1::PendingPayload payload;
  util::TimePoint    created_at{};
  uint32_t           attempts = 0;

  // bumped on every coalesced write; not persisted
  uint64_t revision = 0;
};

struct DrainReport {
  // entries removed from the queue; each one shrinks it by exactly one
  std::size_t acknowledged = 0;
  std::size_t failed       = 0;

  // sends the service accepted for an entry that was replaced or abandoned in flight
  std::size_t superseded = 0;

  // another drain was already running; it will make a follow-up pass
  bool skipped = false;

  remote::RemoteResult last_error;
};

/*
  Durable FIFO of writes the Inventory Service has not acknowledged.

  Every entry is written to the Repository before it becomes visible, so the
  queue survives restarts (Hydrate() reloads it). Only Drain() dequeues, and
  only on acknowledgment; Abandon() is the explicit escape hatch.

  Thread-safe. Remote calls are made without holding the queue lock.
*/
class PendingUpdateQueue {
 public:
  using SizeListener = std::function<void(std::size_t size)>;

  PendingUpdateQueue(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock);

  PendingUpdateQueue(const PendingUpdateQueue&)            = delete;
  PendingUpdateQueue& operator=(const PendingUpdateQueue&) = delete;

  // Replaces the in-memory view with the persisted entries.
  void Hydrate();

  /*
    Appends a write, or replaces the payload of the queued write for the
    same (session, area item, kind) in place. Returns the entry id.
  */
  std::string Enqueue(const std::string& session_id, const std::string& area_item_id, v1::PendingPayload payload);

  /*
    Sends entries from the front until one fails or the queue is empty.
    A call made while another drain runs returns at once (skipped) and
    makes the running drain do one more pass.
  */
  DrainReport Drain(remote::InventoryService& service);

  // Drops an entry without sending it. False if the id is unknown.
  bool Abandon(const std::string& id);

  std::size_t                    Size() const;
  bool                           Contains(const std::string& id) const;
  std::vector<PendingUpdate>     Snapshot() const;
  std::optional<util::TimePoint> LastSyncAt() const;
  bool                           Draining() const;

  void SetSizeListener(SizeListener listener);

 private:
  void RunPass(remote::InventoryService& service, DrainReport& report);
  void NotifySize(std::size_t size);

  std::deque<PendingUpdate>::iterator FindLocked(const std::string& id);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;

  mutable std::mutex             mutex_;
  std::deque<PendingUpdate>      entries_;
  uint64_t                       next_sequence_ = 1;
  uint64_t                       next_revision_ = 1;
  std::optional<util::TimePoint> last_sync_at_;
  SizeListener                   size_listener_;

  std::atomic<bool> draining_{false};
  std::atomic<bool> follow_up_{false};
};

} // namespace stockcount::session
