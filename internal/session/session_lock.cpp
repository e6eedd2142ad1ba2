#include "session_lock.hpp"

namespace profile::session {

std::string_view ToString(LockState state) {
  switch (state) {
    case LockState::kUnlocked:
      return "unlocked";
    case LockState::kAcquiring:
      return "acquiring";
    case LockState::kLocked:
      return "locked";
    case LockState::kReleasing:
      return "releasing";
    case LockState::kDegraded:
      return "degraded";
  }
  return "unknown";
}

std::string_view ToString(LockVerdict verdict) {
  switch (verdict) {
    case LockVerdict::kFree:
      return "free";
    case LockVerdict::kOwned:
      return "owned";
    case LockVerdict::kAbandoned:
      return "abandoned";
    case LockVerdict::kHeld:
      return "held";
  }
  return "unknown";
}

void Stamp(profile::store::v1::ProfileMetadata* metadata, const std::string& owner_token, util::TimePoint now) {
  auto* session = metadata->mutable_session_data();
  session->set_last_update(util::ToUnixMillis(now));
  session->set_owner_token(owner_token);
}

void Clear(profile::store::v1::ProfileMetadata* metadata) {
  metadata->clear_session_data();
}

StaleLockTracker::StaleLockTracker(std::string own_token, std::chrono::milliseconds lock_timeout, util::TimePoint acquisition_start)
    : own_token_(std::move(own_token)), lock_timeout_(lock_timeout), acquisition_start_(acquisition_start) {
}

std::chrono::milliseconds StaleLockTracker::Waited(util::TimePoint now) const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(now - acquisition_start_);
}

LockVerdict StaleLockTracker::Observe(const profile::store::v1::ProfileMetadata& metadata, util::TimePoint now) {
  if (!metadata.has_session_data()) {
    return LockVerdict::kFree;
  }

  const auto& stamp = metadata.session_data();
  if (stamp.owner_token() == own_token_) {
    return LockVerdict::kOwned;
  }

  last_age_ = std::chrono::duration_cast<std::chrono::milliseconds>(now - util::FromUnixMillis(stamp.last_update()));
  return last_age_ > lock_timeout_ && Waited(now) > lock_timeout_ ? LockVerdict::kAbandoned : LockVerdict::kHeld;
}

} // namespace profile::session
