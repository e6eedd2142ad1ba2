#include "sqlite_db.hpp"

#include <stdexcept>

namespace profile::kv::sqlite {

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("open " + path_ + ": " + msg);
  }

  try {
    Configure(wal_mode);
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
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteDB::Configure(bool wal_mode) {
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }
  Exec("PRAGMA synchronous=NORMAL;");

  if (sqlite3_busy_timeout(db_, 5000) != SQLITE_OK) {
    throw std::runtime_error(std::string("busy_timeout: ") + sqlite3_errmsg(db_));
  }
}

} // namespace profile::kv::sqlite
