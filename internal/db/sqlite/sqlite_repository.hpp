#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace stockcount::db::sqlite {

// Brings the schema up to date. Safe to call on every start.
void BootstrapSchema(SqliteDB& db);

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace stockcount::db::sqlite
