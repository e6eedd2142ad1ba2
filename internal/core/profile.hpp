#pragma once

#include <google/protobuf/struct.pb.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/ledger/version_ledger.hpp"
#include "internal/lifecycle/teardown.hpp"
#include "internal/notify/change_notifier.hpp"
#include "internal/session/session_lock.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/time.hpp"
#include "profile_options.hpp"
#include "profile/store/v1/document.pb.h"

namespace profile::core {

enum class LoadOutcome {
  kCreated,   // no version existed; template saved as the first version
  kClaimed,   // latest version loaded and its session lock taken
  kDegraded,  // template in memory only, persistence disabled
};

enum class SaveResult {
  kSaved,
  kSkipped,       // not holding the lock, or persistence disabled
  kWriteFailed,   // document write failed; nothing changed remotely
  kLedgerFailed,  // document written but not indexed; persistence now disabled
};

std::string_view ToString(LoadOutcome outcome);
std::string_view ToString(SaveResult result);

/*
  Profile

  One owner's document plus its session lock. Load() acquires the lock or
  falls back to the template; saves append a new version and advance the
  ledger; the path API mutates the in-memory document and fires Changed.

  Thread-safety: all public methods may be called from any thread. The
  document is guarded by mutex_; saves are serialized by save_mutex_ and do
  store I/O without holding mutex_, so mutations never wait on the store.
  Events are emitted with no lock held.
*/
class Profile {
 public:
  Profile(std::string owner_id, ProfileContext context, util::CancellationToken token);
  ~Profile();

  Profile(const Profile&)            = delete;
  Profile& operator=(const Profile&) = delete;

  // Runs the acquisition protocol once; later calls wait for and return the
  // first call's outcome.
  LoadOutcome Load();

  SaveResult Save(bool release_session = false);

  // Saves when at least save_interval has passed since the last save.
  SaveResult SaveIfDue(util::TimePoint now);

  // Whole document when `path` is empty.
  std::optional<google::protobuf::Value> Get(std::string_view path = {}) const;

  bool Set(std::string_view path, const std::optional<google::protobuf::Value>& value, bool notify = true);
  bool SetMultiple(const std::map<std::string, std::optional<google::protobuf::Value>>& values);
  bool Insert(std::string_view path, const google::protobuf::Value& value);
  bool RemoveValue(std::string_view path, const google::protobuf::Value& value);
  bool RemoveValues(std::string_view path, const std::vector<google::protobuf::Value>& values);
  bool Increment(std::string_view path, double delta);

  // Adds template keys missing from the document. Returns true if any were added.
  bool Reconcile();
  void Reset();

  // Runs the teardown list: autosave cancel, subscriptions, release-save.
  void Close();

  notify::ChangeNotifier& Events() {
    return notifier_;
  }

  lifecycle::Teardown& Cleanup() {
    return teardown_;
  }

  const std::string& OwnerId() const {
    return owner_id_;
  }

  session::LockState                  State() const;
  bool                                IsNew() const;
  bool                                PersistenceEnabled() const;
  std::int64_t                        LastVersion() const;
  profile::store::v1::ProfileMetadata Snapshot() const;

 private:
  struct Claim {
    profile::store::v1::ProfileMetadata metadata;
    std::optional<std::int64_t>         base_version;
    bool                                created{false};
  };

  LoadOutcome DoLoad();
  LoadOutcome Acquire(Claim claim);
  LoadOutcome Degrade(std::string_view reason);

  // Caller holds save_mutex_.
  SaveResult SaveLocked(bool release_session);

  bool ApplyMutation(std::string_view operation, std::string_view path, bool notify,
                     const std::function<bool(google::protobuf::Struct*)>& mutate);

  profile::store::v1::ProfileMetadata FreshMetadata(util::TimePoint now) const;

  const std::string       owner_id_;
  ProfileContext          context_;
  util::CancellationToken token_;
  ledger::VersionLedger   ledger_;

  mutable std::mutex                  mutex_;
  profile::store::v1::ProfileMetadata metadata_;
  session::LockState                  state_{session::LockState::kUnlocked};
  bool                                is_new_{true};
  std::int64_t                        last_version_{0};
  util::TimePoint                     last_save_{};

  std::mutex        save_mutex_;
  std::once_flag    load_once_;
  LoadOutcome       load_outcome_{LoadOutcome::kDegraded};
  std::atomic<bool> closed_{false};

  notify::ChangeNotifier notifier_;
  lifecycle::Teardown    teardown_;
};

} // namespace profile::core
