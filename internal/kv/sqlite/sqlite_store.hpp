#pragma once

#include <memory>
#include <mutex>

#include "internal/kv/api/remote_store.hpp"
#include "sqlite_db.hpp"

namespace profile::kv::sqlite {

/*
  RemoteStore over a sqlite file.

    entries(name, key, value)            one row per document version
    versions(seq, name, scope, version)  append-only index, ordered by seq
*/
class SqliteStore final : public RemoteStore {
 public:
  explicit SqliteStore(std::shared_ptr<SqliteDB> db);

  Result Get(const std::string& name, const std::string& key, std::string* value) override;
  Result Put(const std::string& name, const std::string& key, const std::string& value) override;
  Result ListSorted(const std::string& name, const std::string& scope, bool descending, std::size_t page_size,
                    std::vector<std::int64_t>* versions) override;
  Result Append(const std::string& name, const std::string& scope, std::int64_t version) override;

 private:
  static Result Translate(sqlite3* db, int rc);

  void Migrate();

  std::shared_ptr<SqliteDB> db_;
  std::mutex                mutex_;
};

} // namespace profile::kv::sqlite
