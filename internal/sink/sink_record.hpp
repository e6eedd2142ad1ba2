#pragma once

#include <cstdint>
#include <string>

namespace profile::sink {

// One successfully saved document version, as written to the store.
struct SinkRecord {
  std::string  store_name;
  std::string  owner_id;
  std::int64_t version{0};
  std::string  document_json;
};

} // namespace profile::sink
