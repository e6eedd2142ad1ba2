#include "memory_store.hpp"

#include <algorithm>

namespace profile::kv::memory {

bool MemoryStore::ConsumeFailure(Operation op, Result* result) {
  ++calls_[op];

  auto it = failures_.find(op);
  if (it == failures_.end() || it->second.remaining == 0) {
    return false;
  }
  if (it->second.remaining > 0) {
    --it->second.remaining;
  }
  *result = Result::Err(it->second.code, "injected failure");
  return true;
}

Result MemoryStore::Get(const std::string& name, const std::string& key, std::string* value) {
  std::lock_guard lock(mutex_);
  Result          injected;
  if (ConsumeFailure(Operation::kGet, &injected)) {
    return injected;
  }

  auto it = entries_.find({name, key});
  if (it == entries_.end()) {
    return Result::Err(ErrorCode::NotFound, "no entry " + name + "/" + key);
  }
  *value = it->second;
  return Result::Ok();
}

Result MemoryStore::Put(const std::string& name, const std::string& key, const std::string& value) {
  std::lock_guard lock(mutex_);
  Result          injected;
  if (ConsumeFailure(Operation::kPut, &injected)) {
    return injected;
  }

  entries_[{name, key}] = value;
  return Result::Ok();
}

Result MemoryStore::ListSorted(const std::string& name, const std::string& scope, bool descending, std::size_t page_size,
                               std::vector<std::int64_t>* versions) {
  std::lock_guard lock(mutex_);
  Result          injected;
  if (ConsumeFailure(Operation::kListSorted, &injected)) {
    return injected;
  }

  versions->clear();
  auto it = versions_.find({name, scope});
  if (it == versions_.end()) {
    return Result::Ok();
  }

  const auto& index = it->second;
  const auto  count = page_size == 0 ? index.size() : std::min(page_size, index.size());
  if (descending) {
    versions->assign(index.rbegin(), index.rbegin() + static_cast<std::ptrdiff_t>(count));
  } else {
    versions->assign(index.begin(), index.begin() + static_cast<std::ptrdiff_t>(count));
  }
  return Result::Ok();
}

Result MemoryStore::Append(const std::string& name, const std::string& scope, std::int64_t version) {
  std::lock_guard lock(mutex_);
  Result          injected;
  if (ConsumeFailure(Operation::kAppend, &injected)) {
    return injected;
  }

  versions_[{name, scope}].push_back(version);
  return Result::Ok();
}

void MemoryStore::FailNext(Operation op, int count, ErrorCode code) {
  std::lock_guard lock(mutex_);
  failures_[op] = Failure{count, code};
}

void MemoryStore::ClearFailures() {
  std::lock_guard lock(mutex_);
  failures_.clear();
}

std::size_t MemoryStore::CallCount(Operation op) const {
  std::lock_guard lock(mutex_);
  auto            it = calls_.find(op);
  return it == calls_.end() ? 0 : it->second;
}

std::size_t MemoryStore::EntryCount() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

} // namespace profile::kv::memory
