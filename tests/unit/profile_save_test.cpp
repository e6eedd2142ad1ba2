#include "internal/core/profile.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <vector>

#include "internal/document/document_codec.hpp"
#include "internal/kv/memory/memory_store.hpp"
#include "internal/sink/sink_worker.hpp"

namespace {

using namespace std::chrono_literals;
using profile::core::LoadOutcome;
using profile::core::Profile;
using profile::core::ProfileContext;
using profile::core::SaveResult;
using profile::kv::memory::MemoryStore;
using profile::session::LockState;
using profile::store::v1::ProfileMetadata;
using profile::util::CancellationToken;

constexpr const char* kStoreName = "PlayerData/1";

ProfileContext MakeContext(const std::shared_ptr<MemoryStore>& store) {
  google::protobuf::Struct templ;
  (*templ.mutable_fields())["coins"].set_number_value(100);
  (*templ.mutable_fields())["scratch"].set_string_value("client only");

  ProfileContext context;
  context.store       = store;
  context.templ       = profile::document::MakeFixedTemplate(templ);
  context.owner_token = "token-a";

  context.options.store_name             = kStoreName;
  context.options.save_interval          = 50ms;
  context.options.session_lock_timeout   = 200ms;
  context.options.session_check_interval = 5ms;
  context.options.retry                  = {2, 1ms};
  context.options.keys_to_ignore         = {"scratch"};
  return context;
}

std::vector<std::int64_t> Versions(MemoryStore& store, const std::string& owner) {
  std::vector<std::int64_t> versions;
  assert(store.ListSorted(kStoreName, owner, false, 0, &versions));
  return versions;
}

ProfileMetadata StoredVersion(MemoryStore& store, const std::string& owner, std::int64_t version) {
  std::string bytes;
  assert(store.Get(kStoreName, profile::ledger::DocumentKey(owner, version), &bytes));

  ProfileMetadata metadata;
  std::string     error;
  assert(profile::document::Decode(bytes, &metadata, &error));
  return metadata;
}

class RecordingSink final : public profile::sink::SaveSink {
 public:
  void Forward(const profile::sink::SinkRecord& record) override {
    std::lock_guard lock(mutex_);
    records_.push_back(record);
  }

  std::vector<profile::sink::SinkRecord> Records() const {
    std::lock_guard lock(mutex_);
    return records_;
  }

 private:
  mutable std::mutex                     mutex_;
  std::vector<profile::sink::SinkRecord> records_;
};

void TestEverySaveAppendsAStrictlyNewerVersion() {
  auto    store = std::make_shared<MemoryStore>();
  Profile profile("p1", MakeContext(store), CancellationToken{});
  assert(profile.Load() == LoadOutcome::kCreated);

  assert(profile.Save() == SaveResult::kSaved);
  assert(profile.Save() == SaveResult::kSaved);
  assert(profile.Save() == SaveResult::kSaved);

  const auto versions = Versions(*store, "p1");
  assert(versions.size() == 4);
  for (std::size_t i = 1; i < versions.size(); ++i) {
    assert(versions[i] > versions[i - 1]);
  }
  assert(profile.LastVersion() == versions.back());

  // earlier versions stay readable
  assert(StoredVersion(*store, "p1", versions.front()).sessions() == 1);
}

void TestIgnoredKeysStayInMemoryOnly() {
  auto    store = std::make_shared<MemoryStore>();
  Profile profile("p1", MakeContext(store), CancellationToken{});
  assert(profile.Load() == LoadOutcome::kCreated);
  assert(profile.Set("coins", [] {
    google::protobuf::Value v;
    v.set_number_value(250);
    return v;
  }()));
  assert(profile.Save() == SaveResult::kSaved);

  const auto stored = StoredVersion(*store, "p1", profile.LastVersion());
  assert(stored.data().fields().at("coins").number_value() == 250);
  assert(!stored.data().fields().count("scratch"));
  assert(stored.session_data().owner_token() == "token-a");
  assert(stored.last_seen() > 0);

  assert(profile.Get("scratch")->string_value() == "client only");
}

void TestSavedFiresOnlyAfterSuccess() {
  auto    store = std::make_shared<MemoryStore>();
  Profile profile("p1", MakeContext(store), CancellationToken{});
  assert(profile.Load() == LoadOutcome::kCreated);

  int  saved = 0;
  auto sub   = profile.Events().OnSaved([&](const google::protobuf::Struct& doc) {
    assert(doc.fields().count("scratch"));
    ++saved;
  });

  store->FailNext(MemoryStore::Operation::kPut, -1);
  const auto before = Versions(*store, "p1").size();
  assert(profile.Save() == SaveResult::kWriteFailed);
  assert(saved == 0);
  assert(profile.State() == LockState::kLocked);
  assert(Versions(*store, "p1").size() == before);

  store->ClearFailures();
  assert(profile.Save() == SaveResult::kSaved);
  assert(saved == 1);
}

void TestTransientWriteFailureIsRetried() {
  auto    store = std::make_shared<MemoryStore>();
  Profile profile("p1", MakeContext(store), CancellationToken{});
  assert(profile.Load() == LoadOutcome::kCreated);

  store->FailNext(MemoryStore::Operation::kPut, 1, profile::kv::ErrorCode::Busy);
  assert(profile.Save() == SaveResult::kSaved);
}

void TestLedgerFailureDisablesPersistence() {
  auto    store = std::make_shared<MemoryStore>();
  Profile profile("p1", MakeContext(store), CancellationToken{});
  assert(profile.Load() == LoadOutcome::kCreated);

  store->FailNext(MemoryStore::Operation::kAppend, -1);
  assert(profile.Save() == SaveResult::kLedgerFailed);
  assert(profile.State() == LockState::kDegraded);
  assert(!profile.PersistenceEnabled());

  const auto puts = store->CallCount(MemoryStore::Operation::kPut);
  assert(profile.Save() == SaveResult::kSkipped);
  assert(profile.SaveIfDue(profile::util::Now() + 1h) == SaveResult::kSkipped);
  profile.Close();
  assert(store->CallCount(MemoryStore::Operation::kPut) == puts);

  // mutations keep working on the volatile copy
  assert(profile.Increment("coins", 1));
  assert(profile.Get("coins")->number_value() == 101);
}

void TestReleaseSaveClearsTheLock() {
  auto    store = std::make_shared<MemoryStore>();
  Profile profile("p1", MakeContext(store), CancellationToken{});
  assert(profile.Load() == LoadOutcome::kCreated);

  assert(profile.Save(true) == SaveResult::kSaved);
  assert(profile.State() == LockState::kUnlocked);
  assert(!profile.Snapshot().has_session_data());
  assert(!StoredVersion(*store, "p1", profile.LastVersion()).has_session_data());

  const auto puts = store->CallCount(MemoryStore::Operation::kPut);
  assert(profile.Save() == SaveResult::kSkipped);
  profile.Close();
  assert(store->CallCount(MemoryStore::Operation::kPut) == puts);
}

void TestCloseIssuesReleaseSave() {
  auto    store = std::make_shared<MemoryStore>();
  Profile profile("p1", MakeContext(store), CancellationToken{});
  assert(profile.Load() == LoadOutcome::kCreated);

  const auto before = Versions(*store, "p1").size();
  profile.Close();
  const auto after = Versions(*store, "p1");
  assert(after.size() == before + 1);
  assert(!StoredVersion(*store, "p1", after.back()).has_session_data());
}

void TestSaveIfDueHonoursInterval() {
  auto    store = std::make_shared<MemoryStore>();
  Profile profile("p1", MakeContext(store), CancellationToken{});
  assert(profile.Load() == LoadOutcome::kCreated);

  const auto now = profile::util::Now();
  assert(profile.SaveIfDue(now) == SaveResult::kSkipped);
  assert(profile.SaveIfDue(now + 60ms) == SaveResult::kSaved);
  assert(profile.SaveIfDue(now + 10ms) == SaveResult::kSkipped);
}

void TestSavedDocumentsReachTheSink() {
  auto store = std::make_shared<MemoryStore>();
  auto sink  = std::make_shared<RecordingSink>();
  auto ctx   = MakeContext(store);
  ctx.sink   = std::make_shared<profile::sink::SinkDispatcher>(sink, 8);

  {
    Profile profile("p1", ctx, CancellationToken{});
    assert(profile.Load() == LoadOutcome::kCreated);
    assert(profile.Save() == SaveResult::kSaved);
  }
  ctx.sink->Stop();

  const auto records = sink->Records();
  assert(records.size() == 3);
  assert(records[0].store_name == kStoreName);
  assert(records[0].owner_id == "p1");
  assert(records[0].version < records[1].version);
  assert(records[2].document_json.find("scratch") == std::string::npos);
}

} // namespace

int main() {
  TestEverySaveAppendsAStrictlyNewerVersion();
  TestIgnoredKeysStayInMemoryOnly();
  TestSavedFiresOnlyAfterSuccess();
  TestTransientWriteFailureIsRetried();
  TestLedgerFailureDisablesPersistence();
  TestReleaseSaveClearsTheLock();
  TestCloseIssuesReleaseSave();
  TestSaveIfDueHonoursInterval();
  TestSavedDocumentsReachTheSink();

  std::cout << "profile_store_unit_profile_save: pass\n";
  return 0;
}
