#include "pg_store.hpp"

#include <limits>

namespace profile::kv::postgres {

PgStore::PgStore(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgStore::Migrate() {
  auto       conn = pool_->Acquire();
  pqxx::work tx(*conn);
  tx.exec(
      "CREATE TABLE IF NOT EXISTS entries ("
      "  name  TEXT NOT NULL,"
      "  key   TEXT NOT NULL,"
      "  value TEXT NOT NULL,"
      "  PRIMARY KEY (name, key));");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS versions ("
      "  seq     BIGSERIAL PRIMARY KEY,"
      "  name    TEXT NOT NULL,"
      "  scope   TEXT NOT NULL,"
      "  version BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS versions_scope ON versions(name, scope, seq);");
  tx.commit();
}

Result PgStore::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::Unavailable, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::Busy, e.what());
  }
  if (dynamic_cast<const pqxx::in_doubt_error*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgStore::Get(const std::string& name, const std::string& key, std::string* value) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    auto       res = tx.exec_prepared("get_entry", name, key);
    tx.commit();
    if (res.empty()) {
      return Result::Err(ErrorCode::NotFound, "no entry " + name + "/" + key);
    }
    *value = res[0][0].as<std::string>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgStore::Put(const std::string& name, const std::string& key, const std::string& value) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    tx.exec_prepared("put_entry", name, key, value);
    tx.commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgStore::ListSorted(const std::string& name, const std::string& scope, bool descending, std::size_t page_size,
                           std::vector<std::int64_t>* versions) {
  try {
    const std::int64_t limit = page_size == 0 ? std::numeric_limits<std::int64_t>::max() : static_cast<std::int64_t>(page_size);

    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    auto       res = tx.exec_prepared(descending ? "list_versions_desc" : "list_versions_asc", name, scope, limit);
    tx.commit();

    versions->clear();
    versions->reserve(res.size());
    for (const auto& row : res) {
      versions->push_back(row[0].as<std::int64_t>());
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgStore::Append(const std::string& name, const std::string& scope, std::int64_t version) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    tx.exec_prepared("append_version", name, scope, version);
    tx.commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace profile::kv::postgres
