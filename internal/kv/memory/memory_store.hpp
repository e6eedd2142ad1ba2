#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "internal/kv/api/remote_store.hpp"

namespace profile::kv::memory {

/*
  In-process RemoteStore.

  Used when no backend is configured and by tests. Failure injection makes a
  given operation return a chosen error code for the next `count` calls.
*/
class MemoryStore final : public RemoteStore {
 public:
  enum class Operation { kGet, kPut, kListSorted, kAppend };

  Result Get(const std::string& name, const std::string& key, std::string* value) override;
  Result Put(const std::string& name, const std::string& key, const std::string& value) override;
  Result ListSorted(const std::string& name, const std::string& scope, bool descending, std::size_t page_size,
                    std::vector<std::int64_t>* versions) override;
  Result Append(const std::string& name, const std::string& scope, std::int64_t version) override;

  // count < 0 fails every call until ClearFailures().
  void FailNext(Operation op, int count, ErrorCode code = ErrorCode::Unavailable);
  void ClearFailures();

  std::size_t CallCount(Operation op) const;
  std::size_t EntryCount() const;

 private:
  struct Failure {
    int       remaining{0};
    ErrorCode code{ErrorCode::Unavailable};
  };

  // Must hold mutex_.
  bool ConsumeFailure(Operation op, Result* result);

  using Key = std::pair<std::string, std::string>;

  mutable std::mutex                            mutex_;
  std::map<Key, std::string>                    entries_;
  std::map<Key, std::vector<std::int64_t>>      versions_;
  std::map<Operation, Failure>                  failures_;
  std::map<Operation, std::size_t>              calls_;
};

} // namespace profile::kv::memory
