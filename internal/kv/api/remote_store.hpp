#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "result.hpp"

namespace profile::kv {

/*
  Remote key-value store consumed by profiles.

  Two independent surfaces, both scoped by a store name:

    entries   opaque bytes per key; single-key put/get only, no CAS
    versions  append-only ordered index of version ids per scope

  ListSorted orders by append sequence, not by value. Implementations never
  throw; every failure is reported through Result and may be transient.
*/
class RemoteStore {
 public:
  virtual ~RemoteStore() = default;

  virtual Result Get(const std::string& name, const std::string& key, std::string* value) = 0;
  virtual Result Put(const std::string& name, const std::string& key, const std::string& value) = 0;

  virtual Result ListSorted(const std::string& name, const std::string& scope, bool descending, std::size_t page_size,
                            std::vector<std::int64_t>* versions) = 0;
  virtual Result Append(const std::string& name, const std::string& scope, std::int64_t version) = 0;
};

} // namespace profile::kv
