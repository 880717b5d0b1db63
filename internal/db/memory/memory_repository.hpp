#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace stockcount::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertPendingUpdate(Transaction&, const model::PendingUpdateRecord&) override;
  Result UpdatePendingUpdate(Transaction&, const model::PendingUpdateRecord&) override;
  Result DeletePendingUpdate(Transaction&, const std::string&) override;
  std::vector<model::PendingUpdateRecord> ListPendingUpdates(Transaction&) override;

  Result UpsertPausedSession(Transaction&, const model::PausedSessionRecord&) override;
  std::optional<model::PausedSessionRecord> GetPausedSession(Transaction&, const std::string&) override;
  std::vector<model::PausedSessionRecord> ListPausedSessions(Transaction&) override;
  Result DeletePausedSession(Transaction&, const std::string&) override;

  Result UpsertAreaCache(Transaction&, const model::AreaCacheRecord&) override;
  std::optional<model::AreaCacheRecord> GetAreaCache(Transaction&, const std::string&) override;

  Result InsertSessionAlert(Transaction&, const model::SessionAlertRecord&) override;
  std::optional<model::SessionAlertRecord> GetSessionAlert(Transaction&, const std::string&) override;

  Result InsertSessionArchive(Transaction&, const model::SessionArchiveRecord&) override;
  std::vector<model::SessionArchiveRecord> ListSessionArchive(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::PendingUpdateRecord> pending;
    std::map<std::string, model::PausedSessionRecord>            paused;
    std::unordered_map<std::string, model::AreaCacheRecord>      area_cache;
    std::unordered_map<std::string, model::SessionAlertRecord>   alerts;
    std::vector<model::SessionArchiveRecord>                     archive;
  };

  // held by a MemoryTransaction for its whole lifetime
  std::mutex writer_mutex_;

  std::mutex mutex_;
  State committed_;
};

} // namespace stockcount::db::memory
