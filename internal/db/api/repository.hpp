#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/area_cache_record.hpp"
#include "internal/db/model/paused_session_record.hpp"
#include "internal/db/model/pending_update_record.hpp"
#include "internal/db/model/session_alert_record.hpp"
#include "internal/db/model/session_archive_record.hpp"

namespace stockcount::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Pending updates survive process restarts until deleted

  The device-local store is the source of truth for:
    unacknowledged writes
    paused sessions
    offline area contents
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Pending updates
  // ---------------------------------------------------------------------

  virtual Result InsertPendingUpdate(Transaction&, const model::PendingUpdateRecord&) = 0;

  // Replaces payload, attempts and created_at_ms of an existing entry.
  virtual Result UpdatePendingUpdate(Transaction&, const model::PendingUpdateRecord&) = 0;

  virtual Result DeletePendingUpdate(Transaction&, const std::string& id) = 0;

  // Ordered by sequence, which is insertion order; wall-clock time plays no part.
  virtual std::vector<model::PendingUpdateRecord> ListPendingUpdates(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Paused sessions
  // ---------------------------------------------------------------------

  virtual Result UpsertPausedSession(Transaction&, const model::PausedSessionRecord&) = 0;

  virtual std::optional<model::PausedSessionRecord> GetPausedSession(Transaction&, const std::string& area_id) = 0;

  virtual std::vector<model::PausedSessionRecord> ListPausedSessions(Transaction&) = 0;

  virtual Result DeletePausedSession(Transaction&, const std::string& area_id) = 0;

  // ---------------------------------------------------------------------
  // Offline item cache
  // ---------------------------------------------------------------------

  virtual Result UpsertAreaCache(Transaction&, const model::AreaCacheRecord&) = 0;

  virtual std::optional<model::AreaCacheRecord> GetAreaCache(Transaction&, const std::string& area_id) = 0;

  // ---------------------------------------------------------------------
  // Alerts and history
  // ---------------------------------------------------------------------

  // AlreadyExists when the session has alerted before.
  virtual Result InsertSessionAlert(Transaction&, const model::SessionAlertRecord&) = 0;

  virtual std::optional<model::SessionAlertRecord> GetSessionAlert(Transaction&, const std::string& session_id) = 0;

  virtual Result InsertSessionArchive(Transaction&, const model::SessionArchiveRecord&) = 0;

  // Most recent first.
  virtual std::vector<model::SessionArchiveRecord> ListSessionArchive(Transaction&, const std::string& area_id) = 0;
};

} // namespace stockcount::db
