#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

#if STOCKCOUNT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using stockcount::db::ErrorCode;
using stockcount::db::Repository;
using stockcount::db::memory::MemoryRepository;
using stockcount::db::model::AreaCacheRecord;
using stockcount::db::model::PausedSessionRecord;
using stockcount::db::model::PendingUpdateRecord;
using stockcount::db::model::SessionAlertRecord;
using stockcount::db::model::SessionArchiveRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

PendingUpdateRecord Pending(const std::string& id, uint64_t sequence, uint64_t created_at_ms) {
  return PendingUpdateRecord{.id            = id,
                             .sequence      = sequence,
                             .area_item_id  = id + "-item",
                             .session_id    = "session-1",
                             .payload       = std::string("\x0a\x03" "abc", 5),
                             .created_at_ms = created_at_ms,
                             .attempts      = 0};
}

void VerifyPendingQueueOrderAndLifecycle(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  // sequence alone orders the queue, even after the clock stepped back
  assert(repo.InsertPendingUpdate(*tx, Pending(prefix + "-c", 3, 2000)));
  assert(repo.InsertPendingUpdate(*tx, Pending(prefix + "-b", 2, 1000)));
  assert(repo.InsertPendingUpdate(*tx, Pending(prefix + "-a", 1, 5000)));

  auto dup = repo.InsertPendingUpdate(*tx, Pending(prefix + "-a", 9, 9000));
  assert(!dup);
  assert(dup.code == ErrorCode::AlreadyExists);

  auto listed = repo.ListPendingUpdates(*tx);
  assert(listed.size() == 3);
  assert(listed[0].id == prefix + "-a");
  assert(listed[1].id == prefix + "-b");
  assert(listed[2].id == prefix + "-c");
  assert(listed[0].payload == std::string("\x0a\x03" "abc", 5));

  auto updated     = listed[1];
  updated.attempts = 4;
  updated.payload  = "replaced";
  assert(repo.UpdatePendingUpdate(*tx, updated));

  auto missing = repo.UpdatePendingUpdate(*tx, Pending(prefix + "-none", 1, 1));
  assert(missing.code == ErrorCode::NotFound);

  assert(repo.DeletePendingUpdate(*tx, prefix + "-a"));
  assert(repo.DeletePendingUpdate(*tx, prefix + "-a").code == ErrorCode::NotFound);

  listed = repo.ListPendingUpdates(*tx);
  assert(listed.size() == 2);
  assert(listed[0].id == prefix + "-b");
  assert(listed[0].attempts == 4);
  assert(listed[0].payload == "replaced");

  assert(repo.DeletePendingUpdate(*tx, prefix + "-b"));
  assert(repo.DeletePendingUpdate(*tx, prefix + "-c"));
  tx->Commit();
}

void VerifyPausedSessionReadWrite(Repository& repo, const std::string& area_id) {
  auto tx = repo.Begin();

  PausedSessionRecord record{
      .area_id = area_id, .session_id = "s-1", .snapshot = "snap-1", .paused_at_ms = NowMs(), .return_location_id = "dock"};
  assert(repo.UpsertPausedSession(*tx, record));

  record.session_id = "s-2";
  record.snapshot   = "snap-2";
  assert(repo.UpsertPausedSession(*tx, record));

  auto read = repo.GetPausedSession(*tx, area_id);
  assert(read.has_value());
  assert(read->session_id == "s-2");
  assert(read->snapshot == "snap-2");
  assert(read->return_location_id == "dock");

  bool listed = false;
  for (const auto& paused : repo.ListPausedSessions(*tx)) {
    if (paused.area_id == area_id) listed = true;
  }
  assert(listed);

  assert(repo.DeletePausedSession(*tx, area_id));
  assert(!repo.GetPausedSession(*tx, area_id).has_value());

  // deleting an absent snapshot is not an error
  assert(repo.DeletePausedSession(*tx, area_id));
  tx->Commit();
}

void VerifyAreaCacheReadWrite(Repository& repo, const std::string& area_id) {
  auto tx = repo.Begin();
  assert(!repo.GetAreaCache(*tx, area_id).has_value());

  assert(repo.UpsertAreaCache(*tx, AreaCacheRecord{.area_id = area_id, .snapshot = "v1", .fetched_at_ms = 1}));
  assert(repo.UpsertAreaCache(*tx, AreaCacheRecord{.area_id = area_id, .snapshot = "v2", .fetched_at_ms = 2}));

  auto cached = repo.GetAreaCache(*tx, area_id);
  assert(cached.has_value());
  assert(cached->snapshot == "v2");
  assert(cached->fetched_at_ms == 2);
  tx->Commit();
}

void VerifyAlertsAreRecordedOnce(Repository& repo, const std::string& session_id) {
  auto tx = repo.Begin();

  SessionAlertRecord alert{.session_id = session_id, .critical_count = 2, .title = "Critical stock: Bar", .body = "2 items are below minimum", .alerted_at_ms = NowMs()};
  assert(repo.InsertSessionAlert(*tx, alert));

  auto again = repo.InsertSessionAlert(*tx, alert);
  assert(!again);
  assert(again.code == ErrorCode::AlreadyExists);

  auto read = repo.GetSessionAlert(*tx, session_id);
  assert(read.has_value());
  assert(read->critical_count == 2);
  assert(read->title == "Critical stock: Bar");
  tx->Commit();
}

void VerifyArchiveOrdering(Repository& repo, const std::string& area_id) {
  auto tx = repo.Begin();

  auto archived = [&](const std::string& id, uint64_t finished, const std::string& status) {
    return SessionArchiveRecord{.session_id     = id,
                                .area_id        = area_id,
                                .status         = status,
                                .started_at_ms  = finished - 100,
                                .finished_at_ms = finished,
                                .items_checked  = 3,
                                .items_skipped  = 1,
                                .items_total    = 4,
                                .critical_count = 1,
                                .low_count      = 1,
                                .healthy_count  = 2};
  };

  assert(repo.InsertSessionArchive(*tx, archived(area_id + "-old", 1000, "completed")));
  assert(repo.InsertSessionArchive(*tx, archived(area_id + "-new", 5000, "abandoned")));
  assert(repo.InsertSessionArchive(*tx, archived(area_id + "-mid", 3000, "completed")));
  assert(repo.InsertSessionArchive(*tx, archived(area_id + "-mid", 3000, "completed")).code == ErrorCode::AlreadyExists);

  auto history = repo.ListSessionArchive(*tx, area_id);
  assert(history.size() == 3);
  assert(history[0].session_id == area_id + "-new");
  assert(history[0].status == "abandoned");
  assert(history[1].session_id == area_id + "-mid");
  assert(history[2].session_id == area_id + "-old");
  assert(history[2].items_total == 4);
  assert(history[2].healthy_count == 2);

  assert(repo.ListSessionArchive(*tx, area_id + "-other").empty());
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertPendingUpdate(*tx, Pending(prefix + "-rolled", 1, 1)));
    assert(repo.UpsertAreaCache(*tx, AreaCacheRecord{.area_id = prefix + "-area", .snapshot = "x", .fetched_at_ms = 1}));
    tx->Rollback();
  }

  {
    // dropped without Commit()
    auto tx = repo.Begin();
    assert(repo.InsertPendingUpdate(*tx, Pending(prefix + "-dropped", 2, 2)));
  }

  auto tx = repo.Begin();
  for (const auto& pending : repo.ListPendingUpdates(*tx)) {
    assert(pending.id != prefix + "-rolled");
    assert(pending.id != prefix + "-dropped");
  }
  assert(!repo.GetAreaCache(*tx, prefix + "-area").has_value());
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertPendingUpdate(*tx, Pending(prefix + "-queued", 7, NowMs())));
    assert(repo->UpsertPausedSession(
        *tx, PausedSessionRecord{.area_id = prefix + "-area", .session_id = "s-9", .snapshot = "snap", .paused_at_ms = NowMs(), .return_location_id = ""}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx      = repo->Begin();
  auto pending = repo->ListPendingUpdates(*tx);
  assert(pending.size() == 1);
  assert(pending[0].id == prefix + "-queued");
  assert(pending[0].sequence == 7);

  auto paused = repo->GetPausedSession(*tx, prefix + "-area");
  assert(paused.has_value());
  assert(paused->session_id == "s-9");
  tx->Commit();

  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if STOCKCOUNT_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("stockcount_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<stockcount::db::sqlite::SqliteDB>(db_path);
    stockcount::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<stockcount::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyPendingQueueOrderAndLifecycle(*repo, backend.name + "-pending");
    VerifyPausedSessionReadWrite(*repo, backend.name + "-paused-area");
    VerifyAreaCacheReadWrite(*repo, backend.name + "-cached-area");
    VerifyAlertsAreRecordedOnce(*repo, backend.name + "-alert-session");
    VerifyArchiveOrdering(*repo, backend.name + "-archive-area");
    VerifyRollbackBehavior(*repo, backend.name + "-rollback");
  }

  backend.cleanup();
  VerifyRestartDurability(backend, backend.name + "-durable");
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if STOCKCOUNT_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "stockcount_integration_repository_parity: pass\n";
  return 0;
}
