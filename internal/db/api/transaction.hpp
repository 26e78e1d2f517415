#pragma once

namespace flowlock::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes and releases row locks
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
  Memory: write set + per-row owner table
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  // commit changes atomically; throws DbException on failure
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() has run
  virtual bool IsCommitted() const = 0;
};

} // namespace flowlock::db
