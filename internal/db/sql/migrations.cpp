#include "internal/db/sql/migrations.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace stockcount::db::sql {

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& migrations) {
  int latest = 0;
  for (const auto& migration : migrations) {
    if (migration.version <= latest) {
      throw util::StorageError("schema migrations out of order at version " + std::to_string(migration.version));
    }
    latest = migration.version;
  }

  const int current = executor.SchemaVersion();
  if (current > latest) {
    throw util::StorageError("database schema version " + std::to_string(current) + " is newer than this build (" + std::to_string(latest) + ")");
  }

  int applied = 0;
  for (const auto& migration : migrations) {
    if (migration.version <= current) continue;

    executor.Apply(migration);
    ++applied;
    STOCKCOUNT_LOG_INFO("schema migrated", {observability::IntField("version", migration.version),
                                            observability::StringField("description", migration.description)});
  }
  return applied;
}

const std::vector<Migration>& SchemaMigrations() {
  static const std::vector<Migration> kSchema = {
      {1,
       "offline queue and paused sessions",
       {"CREATE TABLE IF NOT EXISTS pending_updates (id TEXT PRIMARY KEY, sequence INTEGER NOT NULL, area_item_id TEXT NOT NULL, "
        "session_id TEXT NOT NULL, payload BLOB NOT NULL, created_at_ms INTEGER NOT NULL, attempts INTEGER NOT NULL DEFAULT 0);",
        "CREATE INDEX IF NOT EXISTS pending_updates_order ON pending_updates(created_at_ms, sequence);",
        "CREATE TABLE IF NOT EXISTS paused_sessions (area_id TEXT PRIMARY KEY, session_id TEXT NOT NULL, snapshot BLOB NOT NULL, "
        "paused_at_ms INTEGER NOT NULL, return_location_id TEXT);"}},
      {2,
       "area item cache",
       {"CREATE TABLE IF NOT EXISTS area_item_cache (area_id TEXT PRIMARY KEY, snapshot BLOB NOT NULL, fetched_at_ms INTEGER NOT NULL);"}},
      {3,
       "completion alerts and session history",
       {"CREATE TABLE IF NOT EXISTS session_alerts (session_id TEXT PRIMARY KEY, critical_count INTEGER NOT NULL, title TEXT NOT NULL, "
        "body TEXT NOT NULL, alerted_at_ms INTEGER NOT NULL);",
        "CREATE TABLE IF NOT EXISTS session_archive (session_id TEXT PRIMARY KEY, area_id TEXT NOT NULL, status TEXT NOT NULL, "
        "started_at_ms INTEGER NOT NULL, finished_at_ms INTEGER NOT NULL, items_checked INTEGER NOT NULL, items_skipped INTEGER NOT NULL, "
        "items_total INTEGER NOT NULL, critical_count INTEGER NOT NULL, low_count INTEGER NOT NULL, healthy_count INTEGER NOT NULL);",
        "CREATE INDEX IF NOT EXISTS session_archive_area ON session_archive(area_id, finished_at_ms);"}},
      {4,
       "pending queue ordered by sequence",
       {"DROP INDEX IF EXISTS pending_updates_order;",
        "CREATE INDEX IF NOT EXISTS pending_updates_sequence ON pending_updates(sequence);"}},
  };
  return kSchema;
}

} // namespace stockcount::db::sql
