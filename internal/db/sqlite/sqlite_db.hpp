#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace stockcount::db::sqlite {

/*
  Owns the device database file.

  The connection is shared by the engine thread and the drain path, so
  transactions serialize on WriterMutex() rather than on SQLITE_BUSY.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& WriterMutex() {
    return writer_mutex_;
  }

  // Runs one or more statements; throws util::StorageError.
  void Exec(const std::string& sql);

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  writer_mutex_;
};

} // namespace stockcount::db::sqlite
