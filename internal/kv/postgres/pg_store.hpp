#pragma once

#include <exception>
#include <memory>

#include "internal/kv/api/remote_store.hpp"
#include "pg_pool.hpp"

namespace profile::kv::postgres {

// RemoteStore over PostgreSQL; same schema as the sqlite backend.
class PgStore final : public RemoteStore {
 public:
  explicit PgStore(std::shared_ptr<PgPool> pool);

  // Creates the entries/versions tables if missing.
  void Migrate();

  Result Get(const std::string& name, const std::string& key, std::string* value) override;
  Result Put(const std::string& name, const std::string& key, const std::string& value) override;
  Result ListSorted(const std::string& name, const std::string& scope, bool descending, std::size_t page_size,
                    std::vector<std::int64_t>* versions) override;
  Result Append(const std::string& name, const std::string& scope, std::int64_t version) override;

 private:
  static Result Translate(const std::exception& e);

  std::shared_ptr<PgPool> pool_;
};

} // namespace profile::kv::postgres
