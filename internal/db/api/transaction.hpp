#pragma once

namespace bounty::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  The review engine only relies on a transaction being atomic for the
  single statement it wraps; it never keeps one open across steps.

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
  Memory: store lock + working copy
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

}
