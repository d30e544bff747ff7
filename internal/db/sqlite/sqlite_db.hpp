#pragma once

#include <sqlite3.h>

#include <chrono>
#include <mutex>
#include <string>

namespace docflow::db::sqlite {

/*
  Owns the execution store's sqlite3 connection.

  One connection is shared by all workers; transactions serialize on
  TransactionMutex() so BEGIN IMMEDIATE never nests on the connection.
  Every failure is thrown as std::runtime_error naming the database file;
  ExecutionStore reports those as StoreUnavailable.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true, std::chrono::milliseconds busy_timeout = std::chrono::seconds(5));
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

  // Statements without results: transaction control, pragmas, schema.
  void Exec(const std::string& sql);

 private:
  void Configure(bool wal_mode, std::chrono::milliseconds busy_timeout);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace docflow::db::sqlite
