#include "internal/ledger/version_ledger.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

#include "internal/kv/memory/memory_store.hpp"

namespace {

using namespace std::chrono_literals;
using profile::kv::ErrorCode;
using profile::kv::RetryPolicy;
using profile::kv::memory::MemoryStore;
using profile::ledger::VersionLedger;
using profile::util::CancellationSource;
using profile::util::CancellationToken;

constexpr RetryPolicy kFastRetry{3, std::chrono::milliseconds(1)};

void TestDocumentKey() {
  assert(profile::ledger::DocumentKey("player-1", 1700000000000) == "player-1/1700000000000");
}

void TestLatestOfUnknownOwnerIsEmpty() {
  MemoryStore   store;
  VersionLedger ledger(store, "profiles/1", kFastRetry);

  std::optional<std::int64_t> latest = 5;
  assert(ledger.Latest("nobody", CancellationToken{}, &latest));
  assert(!latest);
}

void TestLatestIsMostRecentlyAppended() {
  MemoryStore   store;
  VersionLedger ledger(store, "profiles/1", kFastRetry);

  assert(ledger.Append("p", 200, CancellationToken{}));
  assert(ledger.Append("p", 100, CancellationToken{}));
  assert(ledger.Append("q", 900, CancellationToken{}));

  std::optional<std::int64_t> latest;
  assert(ledger.Latest("p", CancellationToken{}, &latest));
  assert(latest && *latest == 100);

  std::vector<std::int64_t> versions;
  assert(ledger.List("p", 0, CancellationToken{}, &versions));
  assert((versions == std::vector<std::int64_t>{100, 200}));

  assert(ledger.List("p", 1, CancellationToken{}, &versions));
  assert(versions.size() == 1);
}

void TestStoreNamesAreIsolated() {
  MemoryStore   store;
  VersionLedger v1(store, "profiles/1", kFastRetry);
  VersionLedger v2(store, "profiles/2", kFastRetry);

  assert(v1.Append("p", 1, CancellationToken{}));

  std::optional<std::int64_t> latest;
  assert(v2.Latest("p", CancellationToken{}, &latest));
  assert(!latest);
  assert(v2.StoreName() == "profiles/2");
}

void TestTransientFailuresAreRetried() {
  MemoryStore   store;
  VersionLedger ledger(store, "profiles/1", kFastRetry);

  store.FailNext(MemoryStore::Operation::kAppend, 2, ErrorCode::Busy);
  assert(ledger.Append("p", 1, CancellationToken{}));
  assert(store.CallCount(MemoryStore::Operation::kAppend) == 3);
}

void TestRetriesAreBounded() {
  MemoryStore   store;
  VersionLedger ledger(store, "profiles/1", kFastRetry);

  store.FailNext(MemoryStore::Operation::kListSorted, -1);
  std::optional<std::int64_t> latest;
  const auto                  result = ledger.Latest("p", CancellationToken{}, &latest);
  assert(result.code == ErrorCode::Unavailable);
  assert(store.CallCount(MemoryStore::Operation::kListSorted) == 3);
}

void TestPermanentFailuresAreNotRetried() {
  MemoryStore   store;
  VersionLedger ledger(store, "profiles/1", kFastRetry);

  store.FailNext(MemoryStore::Operation::kAppend, 1, ErrorCode::Corruption);
  assert(ledger.Append("p", 1, CancellationToken{}).code == ErrorCode::Corruption);
  assert(store.CallCount(MemoryStore::Operation::kAppend) == 1);
}

void TestCancelledTokenStopsBeforeCalling() {
  MemoryStore        store;
  VersionLedger      ledger(store, "profiles/1", RetryPolicy{5, std::chrono::milliseconds(10000)});
  CancellationSource source;
  source.Cancel();

  std::optional<std::int64_t> latest;
  assert(ledger.Latest("p", source.Token(), &latest).code == ErrorCode::Cancelled);
  assert(store.CallCount(MemoryStore::Operation::kListSorted) == 0);
}

void TestProbeStore() {
  MemoryStore store;
  assert(profile::kv::ProbeStore(store, "profiles/1", kFastRetry).reachable);

  store.FailNext(MemoryStore::Operation::kListSorted, -1);
  const auto health = profile::kv::ProbeStore(store, "profiles/1", kFastRetry);
  assert(!health.reachable);
  assert(!health.detail.empty());
}

} // namespace

int main() {
  TestDocumentKey();
  TestLatestOfUnknownOwnerIsEmpty();
  TestLatestIsMostRecentlyAppended();
  TestStoreNamesAreIsolated();
  TestTransientFailuresAreRetried();
  TestRetriesAreBounded();
  TestPermanentFailuresAreNotRetried();
  TestCancelledTokenStopsBeforeCalling();
  TestProbeStore();

  std::cout << "profile_store_unit_version_ledger: pass\n";
  return 0;
}
