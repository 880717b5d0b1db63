#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace stockcount::db::sqlite {

/*
  BEGIN IMMEDIATE transaction on the shared connection.

  The writer mutex is taken before BEGIN, so the engine thread and a
  reconnect drain queue up in-process instead of on SQLITE_BUSY.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override {
    return finished_;
  }

 private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> writer_;
  bool                         finished_ = false;
};

} // namespace stockcount::db::sqlite
