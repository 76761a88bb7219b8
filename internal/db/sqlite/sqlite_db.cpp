#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/db/sql/migrations.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace bounty::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

namespace {

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {}

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

  int AppliedVersion() override {
    sqlite3_stmt* st = db_.Prepare("SELECT COALESCE(MAX(version),0) FROM schema_migrations;");
    int           rc = sqlite3_step(st);
    int version      = rc == SQLITE_ROW ? sqlite3_column_int(st, 0) : 0;
    sqlite3_finalize(st);
    if (rc != SQLITE_ROW) throw std::runtime_error(std::string("read schema version: ") + sqlite3_errmsg(db_.Handle()));
    return version;
  }

  void RecordVersion(int version) override {
    sqlite3_stmt* st = db_.Prepare("INSERT INTO schema_migrations(version,applied_at_ms) VALUES(?1,?2);");
    sqlite3_bind_int(st, 1, version);
    sqlite3_bind_int64(st, 2, util::NowMs());
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) throw std::runtime_error(std::string("record schema version: ") + sqlite3_errmsg(db_.Handle()));
  }

 private:
  SqliteDB& db_;
};

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure();
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
    // Lock contention and I/O trouble can clear on retry.
    const int primary = rc & 0xff;
    if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED || primary == SQLITE_IOERR) {
      throw util::StoreUnavailable(msg);
    }
    throw std::runtime_error(msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure() {
  // WAL lets readers proceed while a reviewer holds the write lock.
  // ":memory:" databases silently stay in "memory" mode.
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

int SqliteDB::Migrate() {
  std::lock_guard<std::mutex> lock(tx_mutex_);
  SqliteMigrationExecutor     executor(*this);
  Exec("BEGIN IMMEDIATE;");
  try {
    int applied = sql::RunMigrations(executor, sql::Dialect::Sqlite);
    Exec("COMMIT;");
    return applied;
  } catch (const std::exception&) {
    Exec("ROLLBACK;");
    throw;
  }
}

} // namespace bounty::db::sqlite
