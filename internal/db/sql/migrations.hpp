#pragma once

#include <string>
#include <vector>

namespace bounty::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL() and reports which migrations
  it has already applied.
*/

enum class Dialect { Sqlite, Postgres };

struct Migration {
  int         version = 0;
  std::string description;
  std::vector<std::string> statements;
};

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // Highest version recorded in schema_migrations, 0 when none.
  virtual int AppliedVersion() = 0;

  virtual void RecordVersion(int version) = 0;
};

// Ordered schema history for the dialect.
std::vector<Migration> SchemaMigrations(Dialect dialect);

/*
  Runs pending migrations in order.
  Creates schema_migrations first; returns the number applied.
*/
int RunMigrations(MigrationExecutor& executor, Dialect dialect);

} // namespace bounty::db::sql
