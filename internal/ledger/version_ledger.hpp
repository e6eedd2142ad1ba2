#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/kv/api/remote_store.hpp"
#include "internal/kv/retry.hpp"
#include "internal/util/cancellation.hpp"

namespace profile::ledger {

// Key of one saved document version inside the store name.
std::string DocumentKey(const std::string& owner_id, std::int64_t version);

/*
  VersionLedger

  Adapter over the store's ordered version index. One scope per owner; the
  most recently appended id is the only one loaders ever read. Every call
  runs under the configured RetryPolicy.
*/
class VersionLedger {
 public:
  VersionLedger(kv::RemoteStore& store, std::string store_name, kv::RetryPolicy retry);

  // `latest` is reset when the owner has no versions yet.
  kv::Result Latest(const std::string& owner_id, const util::CancellationToken& token, std::optional<std::int64_t>* latest) const;

  kv::Result Append(const std::string& owner_id, std::int64_t version, const util::CancellationToken& token) const;

  // Newest first; limit 0 lists everything.
  kv::Result List(const std::string& owner_id, std::size_t limit, const util::CancellationToken& token,
                  std::vector<std::int64_t>* versions) const;

  const std::string& StoreName() const {
    return store_name_;
  }

 private:
  kv::RemoteStore& store_;
  std::string      store_name_;
  kv::RetryPolicy  retry_;
};

} // namespace profile::ledger
