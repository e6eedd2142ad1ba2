#include "internal/session/session_lock.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

namespace {

using namespace std::chrono_literals;
using profile::session::LockVerdict;
using profile::session::StaleLockTracker;
using profile::store::v1::ProfileMetadata;

ProfileMetadata Stamped(const std::string& token, profile::util::TimePoint at) {
  ProfileMetadata metadata;
  profile::session::Stamp(&metadata, token, at);
  return metadata;
}

void TestStampAndClear() {
  const auto      now = profile::util::Now();
  ProfileMetadata metadata;
  profile::session::Stamp(&metadata, "token-a", now);
  assert(metadata.session_data().owner_token() == "token-a");
  assert(metadata.session_data().last_update() == profile::util::ToUnixMillis(now));

  profile::session::Clear(&metadata);
  assert(!metadata.has_session_data());
}

void TestUnstampedIsFree() {
  const auto       now = profile::util::Now();
  StaleLockTracker tracker("me", 1s, now);
  assert(tracker.Observe(ProfileMetadata{}, now) == LockVerdict::kFree);
}

void TestOwnStampIsOwned() {
  const auto       now = profile::util::Now();
  StaleLockTracker tracker("me", 1s, now - 1h);
  assert(tracker.Observe(Stamped("me", now - 1h), now) == LockVerdict::kOwned);
}

void TestFreshForeignStampIsHeld() {
  const auto       now = profile::util::Now();
  StaleLockTracker tracker("me", 1s, now - 5s);
  assert(tracker.Observe(Stamped("peer", now - 200ms), now) == LockVerdict::kHeld);
  assert(tracker.LastAge() >= 200ms);
}

void TestOldStampIsHeldUntilTheAttemptHasWaited() {
  const auto       start = profile::util::Now();
  StaleLockTracker tracker("me", 1s, start);
  const auto       stamp = Stamped("peer", start - 10s);

  assert(tracker.Observe(stamp, start) == LockVerdict::kHeld);
  assert(tracker.LastAge() >= 10s);
  assert(tracker.Observe(stamp, start + 1s) == LockVerdict::kHeld);
  assert(tracker.Observe(stamp, start + 1001ms) == LockVerdict::kAbandoned);
  assert(tracker.Waited(start + 1001ms) == 1001ms);
}

void TestRefreshedStampIsNeverAbandoned() {
  const auto       start = profile::util::Now();
  StaleLockTracker tracker("me", 1s, start);

  assert(tracker.Observe(Stamped("peer", start), start + 900ms) == LockVerdict::kHeld);
  assert(tracker.Observe(Stamped("peer", start + 1800ms), start + 2s) == LockVerdict::kHeld);
  assert(tracker.Observe(Stamped("peer", start + 1800ms), start + 2801ms) == LockVerdict::kAbandoned);
}

void TestAheadClockStampIsHeld() {
  // a peer whose clock runs an hour ahead never looks old by wall clock
  const auto       start = profile::util::Now();
  StaleLockTracker tracker("me", 1s, start);
  assert(tracker.Observe(Stamped("peer", start + 1h), start + 5s) == LockVerdict::kHeld);
}

void TestToString() {
  assert(profile::session::ToString(profile::session::LockState::kDegraded) == "degraded");
  assert(profile::session::ToString(LockVerdict::kAbandoned) == "abandoned");
}

} // namespace

int main() {
  TestStampAndClear();
  TestUnstampedIsFree();
  TestOwnStampIsOwned();
  TestFreshForeignStampIsHeld();
  TestOldStampIsHeldUntilTheAttemptHasWaited();
  TestRefreshedStampIsNeverAbandoned();
  TestAheadClockStampIsHeld();
  TestToString();

  std::cout << "profile_store_unit_session_lock: pass\n";
  return 0;
}
