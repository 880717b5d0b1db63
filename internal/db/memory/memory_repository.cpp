#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace stockcount::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Pending updates
// ------------------------------------------------------------------

Result MemoryRepository::InsertPendingUpdate(Transaction& t, const model::PendingUpdateRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.pending.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.pending[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdatePendingUpdate(Transaction& t, const model::PendingUpdateRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.pending.find(r.id);
  if (it == s.pending.end()) return Result::Err(ErrorCode::NotFound);
  it->second.payload       = r.payload;
  it->second.attempts      = r.attempts;
  it->second.created_at_ms = r.created_at_ms;
  return Result::Ok();
}

Result MemoryRepository::DeletePendingUpdate(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.pending.erase(id) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::vector<model::PendingUpdateRecord> MemoryRepository::ListPendingUpdates(Transaction& t) {
  const auto&                             s = TX(t).View();
  std::vector<model::PendingUpdateRecord> records;
  records.reserve(s.pending.size());
  for (const auto& [_, record] : s.pending) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) { return a.sequence < b.sequence; });
  return records;
}

// ------------------------------------------------------------------
// Paused sessions
// ------------------------------------------------------------------

Result MemoryRepository::UpsertPausedSession(Transaction& t, const model::PausedSessionRecord& r) {
  TX(t).Mutable().paused[r.area_id] = r;
  return Result::Ok();
}

std::optional<model::PausedSessionRecord> MemoryRepository::GetPausedSession(Transaction& t, const std::string& area_id) {
  const auto& s  = TX(t).View();
  auto        it = s.paused.find(area_id);
  if (it == s.paused.end()) return std::nullopt;
  return it->second;
}

std::vector<model::PausedSessionRecord> MemoryRepository::ListPausedSessions(Transaction& t) {
  const auto&                             s = TX(t).View();
  std::vector<model::PausedSessionRecord> records;
  records.reserve(s.paused.size());
  for (const auto& [_, record] : s.paused) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::DeletePausedSession(Transaction& t, const std::string& area_id) {
  TX(t).Mutable().paused.erase(area_id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Offline item cache
// ------------------------------------------------------------------

Result MemoryRepository::UpsertAreaCache(Transaction& t, const model::AreaCacheRecord& r) {
  TX(t).Mutable().area_cache[r.area_id] = r;
  return Result::Ok();
}

std::optional<model::AreaCacheRecord> MemoryRepository::GetAreaCache(Transaction& t, const std::string& area_id) {
  const auto& s  = TX(t).View();
  auto        it = s.area_cache.find(area_id);
  if (it == s.area_cache.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Alerts and history
// ------------------------------------------------------------------

Result MemoryRepository::InsertSessionAlert(Transaction& t, const model::SessionAlertRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.alerts.contains(r.session_id)) return Result::Err(ErrorCode::AlreadyExists);
  s.alerts[r.session_id] = r;
  return Result::Ok();
}

std::optional<model::SessionAlertRecord> MemoryRepository::GetSessionAlert(Transaction& t, const std::string& session_id) {
  const auto& s  = TX(t).View();
  auto        it = s.alerts.find(session_id);
  if (it == s.alerts.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::InsertSessionArchive(Transaction& t, const model::SessionArchiveRecord& r) {
  auto& s = TX(t).Mutable();
  const bool exists =
      std::any_of(s.archive.begin(), s.archive.end(), [&](const auto& existing) { return existing.session_id == r.session_id; });
  if (exists) return Result::Err(ErrorCode::AlreadyExists);
  s.archive.push_back(r);
  return Result::Ok();
}

std::vector<model::SessionArchiveRecord> MemoryRepository::ListSessionArchive(Transaction& t, const std::string& area_id) {
  const auto&                              s = TX(t).View();
  std::vector<model::SessionArchiveRecord> out;
  for (const auto& record : s.archive) {
    if (record.area_id == area_id) out.push_back(record);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.finished_at_ms > b.finished_at_ms; });
  return out;
}

} // namespace stockcount::db::memory
