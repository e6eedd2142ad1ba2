#pragma once

#include <sqlite3.h>

#include <string>

namespace profile::kv::sqlite {

/*
  RAII owner of a sqlite3 connection. Throws std::runtime_error when the file
  cannot be opened or configured; statement-level errors are left to callers.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, bool wal_mode);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  void Exec(const std::string& sql);

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace profile::kv::sqlite
