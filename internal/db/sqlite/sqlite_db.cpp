#include "sqlite_db.hpp"

#include <stdexcept>

namespace docflow::db::sqlite {

SqliteDB::SqliteDB(std::string path, bool wal_mode, std::chrono::milliseconds busy_timeout) : path_(std::move(path)) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    const std::string reason = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("cannot open execution store " + path_ + ": " + reason);
  }

  try {
    Configure(wal_mode, busy_timeout);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) {
    return;
  }

  const std::string reason = err ? err : sqlite3_errstr(rc);
  sqlite3_free(err);
  throw std::runtime_error(path_ + ": " + reason);
}

void SqliteDB::Configure(bool wal_mode, std::chrono::milliseconds busy_timeout) {
  // Status queries read while a worker holds the write lock.
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }

  // A checkpoint the orchestrator saw commit must survive power loss.
  Exec("PRAGMA synchronous=FULL;");
  Exec("PRAGMA foreign_keys=ON;");

  if (sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count())) != SQLITE_OK) {
    throw std::runtime_error(path_ + ": cannot set busy timeout: " + sqlite3_errmsg(db_));
  }
}

} // namespace docflow::db::sqlite
