#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace stockcount::db::sqlite {

namespace {

void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::StorageError(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StorageError("sqlite open '" + path_ + "': " + msg);
  }

  try {
    Configure();
  } catch (const util::StorageError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw util::StorageError(msg);
  }
}

void SqliteDB::Configure() {
  // distinguishes duplicate keys from other constraint failures
  sqlite3_extended_result_codes(db_, 1);

  // WAL keeps readers going while a writer holds the lock
  Exec("PRAGMA journal_mode=WAL;");

  // pending writes must survive a power cut, not just a crash
  Exec("PRAGMA synchronous=FULL;");

  // wait for locks instead of failing immediately (another process may hold the file)
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
}

} // namespace stockcount::db::sqlite
