#include "version_ledger.hpp"

namespace profile::ledger {

std::string DocumentKey(const std::string& owner_id, std::int64_t version) {
  return owner_id + "/" + std::to_string(version);
}

VersionLedger::VersionLedger(kv::RemoteStore& store, std::string store_name, kv::RetryPolicy retry)
    : store_(store), store_name_(std::move(store_name)), retry_(retry) {
}

kv::Result VersionLedger::Latest(const std::string& owner_id, const util::CancellationToken& token,
                                 std::optional<std::int64_t>* latest) const {
  latest->reset();

  std::vector<std::int64_t> versions;
  auto result = kv::WithRetry(retry_, token, "ledger.latest", [&] { return store_.ListSorted(store_name_, owner_id, true, 1, &versions); });
  if (!result) {
    return result;
  }
  if (!versions.empty()) {
    *latest = versions.front();
  }
  return result;
}

kv::Result VersionLedger::Append(const std::string& owner_id, std::int64_t version, const util::CancellationToken& token) const {
  return kv::WithRetry(retry_, token, "ledger.append", [&] { return store_.Append(store_name_, owner_id, version); });
}

kv::Result VersionLedger::List(const std::string& owner_id, std::size_t limit, const util::CancellationToken& token,
                               std::vector<std::int64_t>* versions) const {
  return kv::WithRetry(retry_, token, "ledger.list", [&] { return store_.ListSorted(store_name_, owner_id, true, limit, versions); });
}

} // namespace profile::ledger
