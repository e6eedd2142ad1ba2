#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/profile_manager.hpp"
#include "internal/kv/api/remote_store.hpp"
#include "internal/kv/api/store_health.hpp"
#include "internal/sink/sink_worker.hpp"

namespace profile::factory {

/*
  Application

  Long-lived objects of a profile process. Member order is teardown order
  in reverse: the manager releases its profiles before the sink drains and
  the store closes.
*/
struct Application {
  std::shared_ptr<kv::RemoteStore>      store;
  std::shared_ptr<sink::SinkDispatcher> sink;
  kv::StoreHealth                       health;  // left unprobed when persistence is off
  std::shared_ptr<core::ProfileManager> manager;
};

/*
  Composition root. The only place that knows concrete store and sink types.
*/

// Backend selected by config.store; memory when none is set.
std::shared_ptr<kv::RemoteStore> BuildStore(const profile::runtime::config::RuntimeConfig& config);

// Null when no external sink is configured.
std::shared_ptr<sink::SinkDispatcher> BuildSink(const profile::runtime::config::RuntimeConfig& config);

// Store, sink, startup health probe and the profile manager.
Application Build(const profile::runtime::config::RuntimeConfig& config);

} // namespace profile::factory
