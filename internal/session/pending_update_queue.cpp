#include "internal/session/pending_update_queue.hpp"

#include <algorithm>
#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace stockcount::session {

namespace {

db::model::PendingUpdateRecord ToRecord(const PendingUpdate& update) {
  db::model::PendingUpdateRecord record;
  record.id            = update.id;
  record.sequence      = update.sequence;
  record.area_item_id  = update.area_item_id;
  record.session_id    = update.session_id;
  record.payload       = update.payload.SerializeAsString();
  record.created_at_ms = util::ToUnixMillis(update.created_at);
  record.attempts      = update.attempts;
  return record;
}

remote::RemoteResult Send(remote::InventoryService& service, const v1::PendingPayload& payload) {
  try {
    switch (payload.kind_case()) {
      case v1::PendingPayload::kItemWrite:
        return service.PersistItemUpdate(payload.item_write());
      case v1::PendingPayload::kSessionCommit:
        return service.CommitSession(payload.session_commit());
      case v1::PendingPayload::KIND_NOT_SET:
        break;
    }
  } catch (const std::exception& e) {
    return remote::RemoteResult::Err(remote::RemoteError::Internal, e.what());
  }
  return remote::RemoteResult::Err(remote::RemoteError::Rejected, "empty pending payload");
}

} // namespace

PendingUpdateQueue::PendingUpdateQueue(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

void PendingUpdateQueue::Hydrate() {
  std::deque<PendingUpdate> loaded;
  uint64_t                  max_sequence = 0;

  {
    auto tx      = repository_->Begin();
    auto records = repository_->ListPendingUpdates(*tx);
    tx->Commit();

    for (const auto& record : records) {
      PendingUpdate update;
      if (!update.payload.ParseFromString(record.payload)) {
        throw util::StorageError("corrupt pending update payload: " + record.id);
      }
      update.id           = record.id;
      update.sequence     = record.sequence;
      update.area_item_id = record.area_item_id;
      update.session_id   = record.session_id;
      update.created_at   = util::FromUnixMillis(record.created_at_ms);
      update.attempts     = record.attempts;
      max_sequence        = std::max(max_sequence, record.sequence);
      loaded.push_back(std::move(update));
    }
  }

  std::size_t size = 0;
  {
    std::scoped_lock lock(mutex_);
    for (auto& update : loaded) {
      update.revision = next_revision_++;
    }
    entries_       = std::move(loaded);
    next_sequence_ = max_sequence + 1;
    size           = entries_.size();
  }

  STOCKCOUNT_LOG_INFO("pending updates hydrated", {observability::IntField("count", static_cast<int64_t>(size))});
  NotifySize(size);
}

std::string PendingUpdateQueue::Enqueue(const std::string& session_id, const std::string& area_item_id, v1::PendingPayload payload) {
  if (payload.kind_case() == v1::PendingPayload::KIND_NOT_SET) {
    throw util::ValidationError("pending update without payload");
  }

  std::string id;
  std::size_t size = 0;
  {
    std::scoped_lock lock(mutex_);

    auto existing = std::find_if(entries_.begin(), entries_.end(), [&](const PendingUpdate& update) {
      return update.session_id == session_id && update.area_item_id == area_item_id && update.payload.kind_case() == payload.kind_case();
    });

    if (existing != entries_.end()) {
      PendingUpdate replaced = *existing;
      replaced.payload       = std::move(payload);
      replaced.revision      = next_revision_++;

      auto tx = repository_->Begin();
      db::ThrowIfFailed(repository_->UpdatePendingUpdate(*tx, ToRecord(replaced)), "update pending update");
      tx->Commit();

      *existing = std::move(replaced);
      id        = existing->id;
    } else {
      PendingUpdate update;
      update.id           = util::NewId();
      update.sequence     = next_sequence_;
      update.area_item_id = area_item_id;
      update.session_id   = session_id;
      update.payload      = std::move(payload);
      update.created_at   = clock_->Now();
      update.revision     = next_revision_++;

      auto tx = repository_->Begin();
      db::ThrowIfFailed(repository_->InsertPendingUpdate(*tx, ToRecord(update)), "insert pending update");
      tx->Commit();

      ++next_sequence_;
      id = update.id;
      entries_.push_back(std::move(update));
    }
    size = entries_.size();
  }

  NotifySize(size);
  return id;
}

DrainReport PendingUpdateQueue::Drain(remote::InventoryService& service) {
  DrainReport report;

  if (draining_.exchange(true)) {
    follow_up_ = true;
    report.skipped = true;
    return report;
  }

  // releases the flag if a pass throws
  struct FlagGuard {
    std::atomic<bool>& flag;
    bool               armed = true;
    ~FlagGuard() {
      if (armed) flag = false;
    }
  } guard{draining_};

  for (;;) {
    do {
      follow_up_ = false;
      RunPass(service, report);
    } while (follow_up_.load());

    guard.armed = false;
    draining_   = false;

    // a caller may have asked for a pass between the last check and the release
    if (!follow_up_.load() || draining_.exchange(true)) {
      break;
    }
    guard.armed = true;
  }

  if (report.failed > 0) {
    STOCKCOUNT_LOG_WARN("pending drain stopped on failure",
                        {observability::IntField("acknowledged", static_cast<int64_t>(report.acknowledged)),
                         observability::StringField("error", remote::ToString(report.last_error.code)),
                         observability::StringField("message", report.last_error.message)});
  } else if (report.acknowledged > 0 || report.superseded > 0) {
    STOCKCOUNT_LOG_DEBUG("pending drain finished", {observability::IntField("acknowledged", static_cast<int64_t>(report.acknowledged)),
                                                    observability::IntField("superseded", static_cast<int64_t>(report.superseded))});
  }
  return report;
}

void PendingUpdateQueue::RunPass(remote::InventoryService& service, DrainReport& report) {
  for (;;) {
    PendingUpdate front;
    {
      std::scoped_lock lock(mutex_);
      if (entries_.empty()) {
        last_sync_at_ = clock_->Now();
        return;
      }
      front = entries_.front();
    }

    const auto result = Send(service, front.payload);

    std::size_t size = 0;
    {
      std::scoped_lock lock(mutex_);
      auto             it = FindLocked(front.id);

      if (result) {
        // abandoned meanwhile, or replaced by a newer write that still has to go out
        if (it != entries_.end() && it->revision == front.revision) {
          auto tx  = repository_->Begin();
          auto res = repository_->DeletePendingUpdate(*tx, front.id);
          if (res.code != db::ErrorCode::NotFound) {
            db::ThrowIfFailed(res, "delete pending update");
          }
          tx->Commit();
          entries_.erase(it);
          ++report.acknowledged;
        } else {
          ++report.superseded;
        }
        size = entries_.size();
      } else {
        if (it != entries_.end()) {
          PendingUpdate failed = *it;
          ++failed.attempts;

          auto tx = repository_->Begin();
          db::ThrowIfFailed(repository_->UpdatePendingUpdate(*tx, ToRecord(failed)), "record pending attempt");
          tx->Commit();

          *it = std::move(failed);
        }
        ++report.failed;
        report.last_error = result;
        return;
      }
    }

    NotifySize(size);
  }
}

bool PendingUpdateQueue::Abandon(const std::string& id) {
  std::size_t size = 0;
  {
    std::scoped_lock lock(mutex_);
    auto             it = FindLocked(id);
    if (it == entries_.end()) {
      return false;
    }

    auto tx = repository_->Begin();
    db::ThrowIfFailed(repository_->DeletePendingUpdate(*tx, id), "abandon pending update");
    tx->Commit();

    entries_.erase(it);
    size = entries_.size();
  }

  STOCKCOUNT_LOG_WARN("pending update abandoned", {observability::StringField("id", id)});
  NotifySize(size);
  return true;
}

std::size_t PendingUpdateQueue::Size() const {
  std::scoped_lock lock(mutex_);
  return entries_.size();
}

bool PendingUpdateQueue::Contains(const std::string& id) const {
  std::scoped_lock lock(mutex_);
  return std::any_of(entries_.begin(), entries_.end(), [&](const PendingUpdate& update) { return update.id == id; });
}

std::vector<PendingUpdate> PendingUpdateQueue::Snapshot() const {
  std::scoped_lock lock(mutex_);
  return {entries_.begin(), entries_.end()};
}

std::optional<util::TimePoint> PendingUpdateQueue::LastSyncAt() const {
  std::scoped_lock lock(mutex_);
  return last_sync_at_;
}

bool PendingUpdateQueue::Draining() const {
  return draining_.load();
}

void PendingUpdateQueue::SetSizeListener(SizeListener listener) {
  std::scoped_lock lock(mutex_);
  size_listener_ = std::move(listener);
}

void PendingUpdateQueue::NotifySize(std::size_t size) {
  SizeListener listener;
  {
    std::scoped_lock lock(mutex_);
    listener = size_listener_;
  }
  if (listener) {
    listener(size);
  }
}

std::deque<PendingUpdate>::iterator PendingUpdateQueue::FindLocked(const std::string& id) {
  return std::find_if(entries_.begin(), entries_.end(), [&](const PendingUpdate& update) { return update.id == id; });
}

} // namespace stockcount::session
