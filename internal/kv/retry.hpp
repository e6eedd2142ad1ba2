#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string_view>

#include "internal/kv/api/remote_store.hpp"
#include "internal/kv/api/store_health.hpp"
#include "internal/util/cancellation.hpp"

namespace profile::kv {

/*
  Bounded retry with a fixed delay between attempts.

  NotFound is an answer, not a failure, and is returned without retrying.
  A cancelled token ends the loop with ErrorCode::Cancelled.
*/
struct RetryPolicy {
  std::uint32_t             max_attempts{5};
  std::chrono::milliseconds delay{2000};
};

Result WithRetry(const RetryPolicy& policy, const util::CancellationToken& token, std::string_view operation,
                 const std::function<Result()>& call);

// Lists the newest entry of a probe scope; any answer other than a transport
// failure counts as reachable.
StoreHealth ProbeStore(RemoteStore& store, const std::string& store_name, const RetryPolicy& policy);

} // namespace profile::kv
