#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace plancast::db::sqlite {

/*
  Thin RAII wrapper around a single sqlite3 connection.

  The connection is shared by all transactions; TxMutex() serializes
  them so BEGIN/COMMIT pairs from different threads never interleave.
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

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (pragmas, schema, BEGIN/COMMIT)
  void Exec(const std::string& sql);

  // Create tables and indexes if missing.
  void BootstrapSchema();

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace plancast::db::sqlite
