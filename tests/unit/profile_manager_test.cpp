#include "internal/core/profile_manager.hpp"

#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include "internal/document/document_codec.hpp"
#include "internal/kv/memory/memory_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using profile::core::LoadOutcome;
using profile::core::OwnerHandle;
using profile::core::ProfileContext;
using profile::core::ProfileManager;
using profile::kv::StoreHealth;
using profile::kv::memory::MemoryStore;
using profile::session::LockState;

constexpr const char* kStoreName = "PlayerData/1";

ProfileContext MakeContext(const std::shared_ptr<MemoryStore>& store, const std::string& token = "") {
  google::protobuf::Struct templ;
  (*templ.mutable_fields())["coins"].set_number_value(100);

  ProfileContext context;
  context.store       = store;
  context.templ       = profile::document::MakeFixedTemplate(templ);
  context.owner_token = token;

  context.options.store_name             = kStoreName;
  context.options.save_interval          = 20ms;
  context.options.session_lock_timeout   = 10s;
  context.options.session_check_interval = 5ms;
  context.options.retry                  = {2, 1ms};
  return context;
}

template <typename Predicate>
bool WaitUntil(Predicate predicate, std::chrono::milliseconds timeout = 2s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) return true;
    std::this_thread::sleep_for(1ms);
  }
  return predicate();
}

void TestConstructionRequiresStoreAndTemplate() {
  bool threw = false;
  try {
    ProfileManager manager(ProfileContext{}, StoreHealth::Healthy());
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestGeneratesOwnerToken() {
  auto           store = std::make_shared<MemoryStore>();
  ProfileManager first(MakeContext(store), StoreHealth::Healthy());
  ProfileManager second(MakeContext(store), StoreHealth::Healthy());
  assert(!first.OwnerToken().empty());
  assert(first.OwnerToken() != second.OwnerToken());

  ProfileManager fixed(MakeContext(store, "token-fixed"), StoreHealth::Healthy());
  assert(fixed.OwnerToken() == "token-fixed");
}

void TestAttachIsIdempotentPerOwner() {
  auto           store = std::make_shared<MemoryStore>();
  ProfileManager manager(MakeContext(store), StoreHealth::Healthy());

  auto owner = std::make_shared<OwnerHandle>("p1");
  auto a     = manager.Attach(owner);
  auto b     = manager.Attach(owner);
  assert(a == b);
  assert(manager.Size() == 1);
  assert(manager.Find("p1") == a);
  assert(!manager.Find("p2"));
  assert(a->State() == LockState::kLocked);

  bool threw = false;
  try {
    manager.Attach(nullptr);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestUnhealthyStoreDisablesPersistence() {
  auto           store = std::make_shared<MemoryStore>();
  ProfileManager manager(MakeContext(store), StoreHealth{false, "connection refused"});
  assert(!manager.PersistenceEnabled());

  auto profile = manager.Attach(std::make_shared<OwnerHandle>("p1"));
  assert(profile->State() == LockState::kDegraded);
  assert(profile->Get("coins")->number_value() == 100);
  assert(manager.Scheduler().TaskCount() == 0);
  assert(store->CallCount(MemoryStore::Operation::kPut) == 0);
}

bool Logged(const std::vector<std::string>& lines, const std::string& needle) {
  for (const auto& line : lines) {
    if (line.find(needle) != std::string::npos) return true;
  }
  return false;
}

void TestConfigDisabledPersistenceIsLogged() {
  auto ring     = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(32);
  auto previous = spdlog::default_logger();
  spdlog::set_default_logger(std::make_shared<spdlog::logger>("capture", ring));

  auto store                          = std::make_shared<MemoryStore>();
  auto context                        = MakeContext(store);
  context.options.persistence_enabled = false;
  {
    ProfileManager manager(std::move(context), StoreHealth{});
    assert(!manager.PersistenceEnabled());
  }

  const auto lines = ring->last_formatted();
  spdlog::set_default_logger(previous);

  assert(Logged(lines, "profile persistence disabled by config"));
  assert(!Logged(lines, "store health check failed"));
  assert(store->CallCount(MemoryStore::Operation::kPut) == 0);
}

void TestDetachReleasesTheLock() {
  auto           store = std::make_shared<MemoryStore>();
  ProfileManager manager(MakeContext(store), StoreHealth::Healthy());

  auto owner   = std::make_shared<OwnerHandle>("p1");
  auto profile = manager.Attach(owner);
  assert(profile->Increment("coins", 1));
  assert(manager.Scheduler().TaskCount() == 1);

  assert(manager.Detach("p1"));
  assert(!manager.Detach("p1"));
  assert(owner->Detached());
  assert(manager.Size() == 0);
  assert(manager.Scheduler().TaskCount() == 0);
  assert(profile->State() == LockState::kUnlocked);

  const auto stored = manager.View("p1");
  assert(stored);
  assert(!stored->has_session_data());
  assert(stored->data().fields().at("coins").number_value() == 101);
}

void TestAutosaveAdvancesVersions() {
  auto           store = std::make_shared<MemoryStore>();
  ProfileManager manager(MakeContext(store), StoreHealth::Healthy(), 5ms);

  auto       profile = manager.Attach(std::make_shared<OwnerHandle>("p1"));
  const auto first   = profile->LastVersion();
  assert(WaitUntil([&] { return manager.Versions("p1", 0).size() >= 3; }));
  assert(profile->LastVersion() > first);
}

void TestViewAndVersions() {
  auto           store = std::make_shared<MemoryStore>();
  ProfileManager manager(MakeContext(store), StoreHealth::Healthy());

  assert(!manager.View("nobody"));
  assert(manager.Versions("nobody", 10).empty());

  auto profile = manager.Attach(std::make_shared<OwnerHandle>("p1"));
  assert(profile->Save() == profile::core::SaveResult::kSaved);

  const auto versions = manager.Versions("p1", 10);
  assert(versions.size() == 2);
  assert(versions.front() == profile->LastVersion());
  assert(manager.Versions("p1", 1).size() == 1);

  // a read-only view does not disturb the holder's lock
  const auto view = manager.View("p1");
  assert(view->session_data().owner_token() == manager.OwnerToken());
  assert(profile->State() == LockState::kLocked);
}

void TestViewReportsCorruptAndUnreachableStores() {
  auto           store = std::make_shared<MemoryStore>();
  ProfileManager manager(MakeContext(store), StoreHealth::Healthy());

  assert(store->Put(kStoreName, profile::ledger::DocumentKey("bad", 5), "garbage"));
  assert(store->Append(kStoreName, "bad", 5));
  bool threw = false;
  try {
    (void)manager.View("bad");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  assert(store->Append(kStoreName, "gone", 6));
  threw = false;
  try {
    (void)manager.View("gone");
  } catch (const profile::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  store->FailNext(MemoryStore::Operation::kListSorted, -1);
  threw = false;
  try {
    (void)manager.Versions("p1", 1);
  } catch (const profile::util::Unavailable&) {
    threw = true;
  }
  assert(threw);
}

void TestDetachAbortsPendingAttach() {
  auto           store = std::make_shared<MemoryStore>();
  ProfileManager holder(MakeContext(store, "token-a"), StoreHealth::Healthy());
  ProfileManager waiter(MakeContext(store, "token-b"), StoreHealth::Healthy());

  assert(holder.Attach(std::make_shared<OwnerHandle>("p1"))->State() == LockState::kLocked);

  auto pending = std::async(std::launch::async, [&] { return waiter.Attach(std::make_shared<OwnerHandle>("p1")); });
  assert(WaitUntil([&] { return waiter.Find("p1") != nullptr; }));
  assert(pending.wait_for(30ms) == std::future_status::timeout);

  assert(waiter.Detach("p1"));
  assert(pending.wait_for(1s) == std::future_status::ready);
  const auto profile = pending.get();
  assert(profile->State() == LockState::kDegraded);
  assert(waiter.Scheduler().TaskCount() == 0);

  assert(holder.View("p1")->session_data().owner_token() == "token-a");
}

void TestHandOffBetweenManagers() {
  auto store = std::make_shared<MemoryStore>();
  {
    ProfileManager first(MakeContext(store, "token-a"), StoreHealth::Healthy());
    auto           profile = first.Attach(std::make_shared<OwnerHandle>("p1"));
    assert(profile->Increment("coins", 9));
  }

  ProfileManager second(MakeContext(store, "token-b"), StoreHealth::Healthy());
  auto           profile = second.Attach(std::make_shared<OwnerHandle>("p1"));
  assert(profile->State() == LockState::kLocked);
  assert(!profile->IsNew());
  assert(profile->Get("coins")->number_value() == 109);
  assert(profile->Snapshot().sessions() == 2);
}

} // namespace

int main() {
  TestConstructionRequiresStoreAndTemplate();
  TestGeneratesOwnerToken();
  TestAttachIsIdempotentPerOwner();
  TestUnhealthyStoreDisablesPersistence();
  TestConfigDisabledPersistenceIsLogged();
  TestDetachReleasesTheLock();
  TestAutosaveAdvancesVersions();
  TestViewAndVersions();
  TestViewReportsCorruptAndUnreachableStores();
  TestDetachAbortsPendingAttach();
  TestHandOffBetweenManagers();

  std::cout << "profile_store_unit_profile_manager: pass\n";
  return 0;
}
