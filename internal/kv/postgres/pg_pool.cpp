#include "pg_pool.hpp"

namespace profile::kv::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    if (conn->is_open()) {
      return Wrap(conn.release());
    }
    // dropped by the server; replace it below
    --live_connections_;
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (...) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_entry", "SELECT value FROM entries WHERE name=$1 AND key=$2");
  conn.prepare("put_entry",
               "INSERT INTO entries(name,key,value) VALUES($1,$2,$3) "
               "ON CONFLICT(name,key) DO UPDATE SET value=excluded.value");
  conn.prepare("list_versions_desc", "SELECT version FROM versions WHERE name=$1 AND scope=$2 ORDER BY seq DESC LIMIT $3");
  conn.prepare("list_versions_asc", "SELECT version FROM versions WHERE name=$1 AND scope=$2 ORDER BY seq ASC LIMIT $3");
  conn.prepare("append_version", "INSERT INTO versions(name,scope,version) VALUES($1,$2,$3)");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released) {
    if (auto self = weak_self.lock()) {
      self->Release(released);
      return;
    }
    delete released;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace profile::kv::postgres
