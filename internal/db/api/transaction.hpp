#pragma once

namespace plancast::db {

/*
  Abstract transaction.

  For every backend:

  - writes are invisible to other transactions until Commit()
  - a transaction reads its own writes
  - the destructor rolls back if neither Commit() nor Rollback() ran
  - a thread must never open a second transaction while holding one;
    the memory and SQLite backends serialize transactions

  SQLite:   BEGIN IMMEDIATE under the connection's transaction mutex
  Postgres: pqxx::work on a pooled connection
  Memory:   working copy under the repository mutex
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  // true once Commit() or Rollback() has run
  virtual bool IsFinished() const = 0;
};

} // namespace plancast::db
