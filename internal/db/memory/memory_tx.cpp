#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace stockcount::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), writer_(repo.writer_mutex_) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_;
}

MemoryTransaction::~MemoryTransaction() {
  Rollback();
}

void MemoryTransaction::Commit() {
  if (finished_) {
    throw util::StorageError("memory transaction already finished");
  }
  {
    std::scoped_lock lock(repo_.mutex_);
    repo_.committed_ = std::move(working_);
  }
  finished_ = true;
  writer_.unlock();
}

void MemoryTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  writer_.unlock();
}

} // namespace stockcount::db::memory
