#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace bounty::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3* connection.

  The connection is shared by every transaction, so transactions take
  TxMutex() for their lifetime; SQLite cannot nest BEGIN on one handle.
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

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  // Apply pending schema migrations; returns how many ran.
  int Migrate();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace bounty::db::sqlite
