#pragma once

#include <string>
#include <vector>

namespace stockcount::db::sql {

/*
  One schema step. Steps are applied in ascending version order inside a
  single transaction each; the backend records the last applied version.
*/
struct Migration {
  int                      version = 0;
  std::string              description;
  std::vector<std::string> statements;
};

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual int  SchemaVersion()                   = 0;
  virtual void Apply(const Migration& migration) = 0;
};

// Applies every migration newer than the stored version. Returns how many ran.
int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& migrations);

// Schema of the device-local store, oldest first.
const std::vector<Migration>& SchemaMigrations();

} // namespace stockcount::db::sql
