#include "sqlite_store.hpp"

#include <limits>

namespace profile::kv::sqlite {
namespace {

constexpr const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS entries (
  name  TEXT NOT NULL,
  key   TEXT NOT NULL,
  value BLOB NOT NULL,
  PRIMARY KEY (name, key)
);

CREATE TABLE IF NOT EXISTS versions (
  seq     INTEGER PRIMARY KEY AUTOINCREMENT,
  name    TEXT NOT NULL,
  scope   TEXT NOT NULL,
  version INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS versions_scope ON versions(name, scope, seq);
)SQL";

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
  }

  ~Statement() {
    sqlite3_finalize(stmt_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool ok() const {
    return rc_ == SQLITE_OK;
  }

  int prepare_rc() const {
    return rc_;
  }

  sqlite3_stmt* get() const {
    return stmt_;
  }

 private:
  sqlite3_stmt* stmt_ = nullptr;
  int           rc_   = SQLITE_OK;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const auto* data = static_cast<const char*>(sqlite3_column_blob(st, col));
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(data, static_cast<std::size_t>(size)) : std::string();
}

} // namespace

SqliteStore::SqliteStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  Migrate();
}

void SqliteStore::Migrate() {
  db_->Exec(kSchema);
}

Result SqliteStore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::Unavailable, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteStore::Get(const std::string& name, const std::string& key, std::string* value) {
  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  Statement st(db, "SELECT value FROM entries WHERE name=? AND key=?;");
  if (!st.ok()) return Translate(db, st.prepare_rc());

  BindText(st.get(), 1, name);
  BindText(st.get(), 2, key);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) {
    return Result::Err(ErrorCode::NotFound, "no entry " + name + "/" + key);
  }
  if (rc != SQLITE_ROW) return Translate(db, rc);

  *value = ColBlob(st.get(), 0);
  return Result::Ok();
}

Result SqliteStore::Put(const std::string& name, const std::string& key, const std::string& value) {
  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  Statement st(db,
               "INSERT INTO entries(name,key,value) VALUES(?,?,?) "
               "ON CONFLICT(name,key) DO UPDATE SET value=excluded.value;");
  if (!st.ok()) return Translate(db, st.prepare_rc());

  BindText(st.get(), 1, name);
  BindText(st.get(), 2, key);
  BindBlob(st.get(), 3, value);

  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteStore::ListSorted(const std::string& name, const std::string& scope, bool descending, std::size_t page_size,
                               std::vector<std::int64_t>* versions) {
  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  const char* sql = descending ? "SELECT version FROM versions WHERE name=? AND scope=? ORDER BY seq DESC LIMIT ?;"
                               : "SELECT version FROM versions WHERE name=? AND scope=? ORDER BY seq ASC LIMIT ?;";
  Statement st(db, sql);
  if (!st.ok()) return Translate(db, st.prepare_rc());

  BindText(st.get(), 1, name);
  BindText(st.get(), 2, scope);
  BindI64(st.get(), 3, page_size == 0 ? std::numeric_limits<std::int64_t>::max() : static_cast<std::int64_t>(page_size));

  versions->clear();
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    versions->push_back(static_cast<std::int64_t>(sqlite3_column_int64(st.get(), 0)));
  }
  return Translate(db, rc);
}

Result SqliteStore::Append(const std::string& name, const std::string& scope, std::int64_t version) {
  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  Statement st(db, "INSERT INTO versions(name,scope,version) VALUES(?,?,?);");
  if (!st.ok()) return Translate(db, st.prepare_rc());

  BindText(st.get(), 1, name);
  BindText(st.get(), 2, scope);
  BindI64(st.get(), 3, version);

  return Translate(db, sqlite3_step(st.get()));
}

} // namespace profile::kv::sqlite
