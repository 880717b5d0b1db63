#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace stockcount::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), writer_(db_->WriterMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    Rollback();
  } catch (const std::exception& e) {
    STOCKCOUNT_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (finished_) {
    throw util::StorageError("sqlite transaction already finished");
  }
  try {
    db_->Exec("COMMIT;");
  } catch (const util::StorageError&) {
    // a failed COMMIT can leave the transaction open
    if (!sqlite3_get_autocommit(db_->Handle())) {
      db_->Exec("ROLLBACK;");
    }
    finished_ = true;
    writer_.unlock();
    throw;
  }
  finished_ = true;
  writer_.unlock();
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  db_->Exec("ROLLBACK;");
  writer_.unlock();
}

} // namespace stockcount::db::sqlite
