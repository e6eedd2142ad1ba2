#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"
#include "profile/store/v1/document.pb.h"

namespace profile::session {

/*
  Session lock state machine.

    kUnlocked -> kAcquiring -> kLocked -> kReleasing -> kUnlocked
    any       -> kDegraded   (persistence disabled, volatile document)
*/
enum class LockState {
  kUnlocked,
  kAcquiring,
  kLocked,
  kReleasing,
  kDegraded,
};

std::string_view ToString(LockState state);

// What an acquisition attempt should do with the stamp it just read.
enum class LockVerdict {
  kFree,       // no stamp
  kOwned,      // stamped by this process
  kAbandoned,  // stamp and this attempt both older than the lock timeout
  kHeld,       // fresh stamp from another process; wait and re-read
};

std::string_view ToString(LockVerdict verdict);

// Writes {last_update: now, owner_token: token} into the document.
void Stamp(profile::store::v1::ProfileMetadata* metadata, const std::string& owner_token, util::TimePoint now);
void Clear(profile::store::v1::ProfileMetadata* metadata);

/*
  Staleness bookkeeping for one acquisition attempt.

  A foreign stamp is abandoned only when its wall-clock age exceeds the lock
  timeout and this attempt has itself been waiting longer than the timeout.
  A loader therefore always waits out one full timeout before taking over,
  however old the stamp looks on its own clock.
*/
class StaleLockTracker {
 public:
  StaleLockTracker(std::string own_token, std::chrono::milliseconds lock_timeout, util::TimePoint acquisition_start);

  LockVerdict Observe(const profile::store::v1::ProfileMetadata& metadata, util::TimePoint now);

  // Wall-clock age of the stamp seen by the last Observe().
  std::chrono::milliseconds LastAge() const {
    return last_age_;
  }

  std::chrono::milliseconds Waited(util::TimePoint now) const;

 private:
  std::string               own_token_;
  std::chrono::milliseconds lock_timeout_;
  util::TimePoint           acquisition_start_;
  std::chrono::milliseconds last_age_{0};
};

} // namespace profile::session
