#pragma once

namespace stockcount::db {

/*
  A unit of work against the device store.

  The engine relies on one transaction covering each multi-table step:
  completing a session archives it, drops its paused snapshot and stamps
  the cached area together; resuming reads and deletes the snapshot
  together.

  Backends guarantee:
    - writes are invisible to other transactions until Commit()
    - Rollback(), or destruction without Commit(), discards every write
    - one transaction at a time; it holds the writer lock until finished,
      so a transaction must never be opened while another is held
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  // committed or rolled back
  virtual bool IsFinished() const = 0;
};

} // namespace stockcount::db
