#include "migrations.hpp"

namespace bounty::db::sql {

namespace {

// Column types differ per dialect; everything else is shared text.
struct Types {
  const char* id_serial;
  const char* i64;
};

std::vector<std::string> InitialSchema(const Types& t) {
  const std::string i64 = t.i64;
  return {
      "CREATE TABLE IF NOT EXISTS bounty_requests ("
      " id TEXT PRIMARY KEY, created_by TEXT NOT NULL, title TEXT NOT NULL, description TEXT NOT NULL,"
      " status INTEGER NOT NULL, pay_type INTEGER NOT NULL,"
      " pay_amount_cents " + i64 + " NOT NULL, speed_bonus_cents " + i64 + " NOT NULL DEFAULT 0,"
      " speed_bonus_deadline_ms " + i64 + ", quality_bonus_cents " + i64 + " NOT NULL DEFAULT 0,"
      " budget_total_cents " + i64 + " NOT NULL, budget_spent_cents " + i64 + " NOT NULL DEFAULT 0,"
      " quantity_needed " + i64 + " NOT NULL, quantity_fulfilled " + i64 + " NOT NULL DEFAULT 0,"
      " published_at_ms " + i64 + " NOT NULL DEFAULT 0, reviewed_by TEXT NOT NULL DEFAULT '',"
      " reviewed_at_ms " + i64 + " NOT NULL DEFAULT 0,"
      " created_at_ms " + i64 + " NOT NULL, updated_at_ms " + i64 + " NOT NULL,"
      " version " + i64 + " NOT NULL DEFAULT 1,"
      " CHECK (budget_spent_cents >= 0 AND budget_spent_cents <= budget_total_cents),"
      " CHECK (quantity_fulfilled >= 0 AND quantity_fulfilled <= quantity_needed));",

      "CREATE INDEX IF NOT EXISTS idx_bounty_requests_status ON bounty_requests(status);",

      "CREATE TABLE IF NOT EXISTS bounty_submissions ("
      " id TEXT PRIMARY KEY, request_id TEXT NOT NULL REFERENCES bounty_requests(id),"
      " contributor_id TEXT NOT NULL, status INTEGER NOT NULL, submitted_at_ms " + i64 + " NOT NULL,"
      " reviewed_by TEXT NOT NULL DEFAULT '', reviewed_at_ms " + i64 + " NOT NULL DEFAULT 0,"
      " review_feedback TEXT NOT NULL DEFAULT '',"
      " earned_amount_cents " + i64 + " NOT NULL DEFAULT 0, bonus_amount_cents " + i64 + " NOT NULL DEFAULT 0,"
      " earning_id TEXT NOT NULL DEFAULT '',"
      " created_at_ms " + i64 + " NOT NULL, updated_at_ms " + i64 + " NOT NULL);",

      "CREATE INDEX IF NOT EXISTS idx_bounty_submissions_status ON bounty_submissions(status, submitted_at_ms);",
      "CREATE INDEX IF NOT EXISTS idx_bounty_submissions_request ON bounty_submissions(request_id);",

      "CREATE TABLE IF NOT EXISTS submission_images ("
      " id TEXT PRIMARY KEY, submission_id TEXT NOT NULL REFERENCES bounty_submissions(id) ON DELETE CASCADE,"
      " file_path TEXT NOT NULL, created_at_ms " + i64 + " NOT NULL);",

      "CREATE INDEX IF NOT EXISTS idx_submission_images_submission ON submission_images(submission_id);",

      // One earning per submission: a second concurrent accept loses at insert time.
      "CREATE TABLE IF NOT EXISTS earnings ("
      " id TEXT PRIMARY KEY, contributor_id TEXT NOT NULL,"
      " submission_id TEXT NOT NULL UNIQUE REFERENCES bounty_submissions(id),"
      " request_id TEXT NOT NULL REFERENCES bounty_requests(id),"
      " amount_cents " + i64 + " NOT NULL, bonus_amount_cents " + i64 + " NOT NULL DEFAULT 0,"
      " currency TEXT NOT NULL DEFAULT 'USD', status INTEGER NOT NULL, description TEXT NOT NULL DEFAULT '',"
      " paid_at_ms " + i64 + " NOT NULL DEFAULT 0, created_at_ms " + i64 + " NOT NULL);",

      "CREATE INDEX IF NOT EXISTS idx_earnings_status ON earnings(status, created_at_ms);",
      "CREATE INDEX IF NOT EXISTS idx_earnings_request ON earnings(request_id);",

      std::string("CREATE TABLE IF NOT EXISTS activity_log (") + "id " + t.id_serial + ","
      " contributor_id TEXT NOT NULL, action TEXT NOT NULL, description TEXT NOT NULL,"
      " metadata_json TEXT NOT NULL DEFAULT '{}', created_at_ms " + i64 + " NOT NULL);",

      "CREATE INDEX IF NOT EXISTS idx_activity_log_contributor ON activity_log(contributor_id, id);",
  };
}

} // namespace

std::vector<Migration> SchemaMigrations(Dialect dialect) {
  const Types types = dialect == Dialect::Postgres ? Types{"BIGSERIAL PRIMARY KEY", "BIGINT"} : Types{"INTEGER PRIMARY KEY AUTOINCREMENT", "INTEGER"};

  std::vector<Migration> out;
  out.push_back(Migration{1, "initial bounty schema", InitialSchema(types)});
  // Committed-earning lookups go from earnings.id to the accepted submission.
  out.push_back(Migration{2, "index submissions by earning",
                          {"CREATE INDEX IF NOT EXISTS idx_bounty_submissions_earning ON bounty_submissions(earning_id);"}});
  return out;
}

int RunMigrations(MigrationExecutor& executor, Dialect dialect) {
  executor.ExecuteSQL(dialect == Dialect::Postgres
                          ? "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms BIGINT NOT NULL);"
                          : "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);");

  const int current = executor.AppliedVersion();
  int       applied = 0;
  for (const auto& migration : SchemaMigrations(dialect)) {
    if (migration.version <= current) continue;
    for (const auto& statement : migration.statements) {
      executor.ExecuteSQL(statement);
    }
    executor.RecordVersion(migration.version);
    ++applied;
  }
  return applied;
}

} // namespace bounty::db::sql
