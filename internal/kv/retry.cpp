#include "retry.hpp"

#include "internal/observability/logging.hpp"

namespace profile::kv {
namespace {

constexpr const char* kProbeScope = "__health__";

bool IsRetryable(ErrorCode code) {
  switch (code) {
    case ErrorCode::Busy:
    case ErrorCode::IOError:
    case ErrorCode::Unavailable:
    case ErrorCode::InternalError:
      return true;
    default:
      return false;
  }
}

} // namespace

Result WithRetry(const RetryPolicy& policy, const util::CancellationToken& token, std::string_view operation,
                 const std::function<Result()>& call) {
  const std::uint32_t attempts = policy.max_attempts == 0 ? 1 : policy.max_attempts;

  Result last;
  for (std::uint32_t attempt = 1; attempt <= attempts; ++attempt) {
    if (token.IsCancelled()) {
      return Result::Err(ErrorCode::Cancelled, std::string(operation) + " cancelled");
    }

    last = call();
    if (last || !IsRetryable(last.code)) {
      return last;
    }

    PROFILE_LOG_DEBUG("store call failed",
                      {observability::StringField("operation", operation), observability::IntField("attempt", attempt),
                       observability::StringField("code", ToString(last.code)),
                       observability::StringField("error", last.message)});

    if (attempt < attempts && !token.WaitFor(policy.delay)) {
      return Result::Err(ErrorCode::Cancelled, std::string(operation) + " cancelled");
    }
  }
  return last;
}

StoreHealth ProbeStore(RemoteStore& store, const std::string& store_name, const RetryPolicy& policy) {
  std::vector<std::int64_t> versions;
  const auto                result = WithRetry(policy, util::CancellationToken{}, "probe",
                                               [&] { return store.ListSorted(store_name, kProbeScope, true, 1, &versions); });
  if (result || result.code == ErrorCode::NotFound) {
    return StoreHealth::Healthy();
  }

  PROFILE_LOG_WARN("store unreachable, persistence disabled",
                   {observability::StringField("store", store_name), observability::StringField("code", ToString(result.code)),
                    observability::StringField("error", result.message)});
  return StoreHealth{false, result.message};
}

} // namespace profile::kv
