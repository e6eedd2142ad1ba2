#include "factory.hpp"

#include <stdexcept>
#include <string>

#include "internal/config/profiles_config.hpp"
#include "internal/kv/memory/memory_store.hpp"
#include "internal/kv/retry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#if PROFILE_DB_SQLITE
#include "internal/kv/sqlite/sqlite_db.hpp"
#include "internal/kv/sqlite/sqlite_store.hpp"
#endif
#if PROFILE_DB_POSTGRES
#include "internal/kv/postgres/pg_pool.hpp"
#include "internal/kv/postgres/pg_store.hpp"
#endif
#if PROFILE_WITH_GRPC
#include "internal/grpc/grpc_remote_store.hpp"
#include "internal/grpc/grpc_save_sink.hpp"
#endif

namespace profile::factory {

using profile::observability::StringField;

std::shared_ptr<kv::RemoteStore> BuildStore(const profile::runtime::config::RuntimeConfig& config) {
  const auto& store = config.store();

  if (store.has_sqlite()) {
#if PROFILE_DB_SQLITE
    if (store.sqlite().path().empty()) {
      throw std::runtime_error("store.sqlite.path must be set");
    }
    auto db = std::make_shared<kv::sqlite::SqliteDB>(store.sqlite().path(), store.sqlite().wal_mode());
    PROFILE_LOG_INFO("using sqlite store", {StringField("path", store.sqlite().path())});
    return std::make_shared<kv::sqlite::SqliteStore>(std::move(db));
#else
    throw std::runtime_error("sqlite store requested but not enabled at build time");
#endif
  }

  if (store.has_postgres()) {
#if PROFILE_DB_POSTGRES
    auto pool = std::make_shared<kv::postgres::PgPool>(store.postgres().connection_uri(), store.postgres().max_connections());
    auto pg   = std::make_shared<kv::postgres::PgStore>(std::move(pool));
    pg->Migrate();
    PROFILE_LOG_INFO("using postgres store");
    return pg;
#else
    throw std::runtime_error("postgres store requested but not enabled at build time");
#endif
  }

  if (store.has_remote()) {
#if PROFILE_WITH_GRPC
    PROFILE_LOG_INFO("using remote store", {StringField("target", store.remote().target())});
    return std::make_shared<grpc::GrpcRemoteStore>(store.remote().target(), util::FromProto(store.remote().deadline()));
#else
    throw std::runtime_error("remote store requested but gRPC support is not enabled at build time");
#endif
  }

  PROFILE_LOG_WARN("no store configured, profiles live in process memory only");
  return std::make_shared<kv::memory::MemoryStore>();
}

std::shared_ptr<sink::SinkDispatcher> BuildSink(const profile::runtime::config::RuntimeConfig& config) {
  const auto& sink_config = config.profiles().external_sink();
  if (sink_config.target().empty()) {
    return nullptr;
  }

#if PROFILE_WITH_GRPC
  auto forwarder = std::make_shared<grpc::GrpcSaveSink>(sink_config.target(), util::FromProto(sink_config.deadline()));
  const std::size_t capacity = sink_config.queue_capacity() == 0 ? 1024 : sink_config.queue_capacity();
  PROFILE_LOG_INFO("forwarding saves to external sink", {StringField("target", sink_config.target())});
  return std::make_shared<sink::SinkDispatcher>(std::move(forwarder), capacity);
#else
  throw std::runtime_error("external sink requested but gRPC support is not enabled at build time");
#endif
}

Application Build(const profile::runtime::config::RuntimeConfig& config) {
  const auto& profiles = config.profiles();

  core::ProfileContext context;
  context.options     = config::ToProfileOptions(profiles);
  context.templ       = config::BuildTemplate(profiles);
  context.owner_token = util::GenerateToken();

  Application app;
  app.store = BuildStore(config);
  app.sink  = BuildSink(config);

  // persistence that is switched off by config never touches the store
  if (context.options.persistence_enabled) {
    app.health = kv::ProbeStore(*app.store, context.options.store_name, context.options.retry);
  }

  context.store = app.store;
  context.sink  = app.sink;
  app.manager   = std::make_shared<core::ProfileManager>(std::move(context), app.health, config::AutosaveTick(profiles));

  PROFILE_LOG_INFO("profile runtime ready", {StringField("store", app.manager->PersistenceEnabled() ? "persistent" : "volatile"),
                                             StringField("owner_token", app.manager->OwnerToken())});
  return app;
}

} // namespace profile::factory
