#include "profile.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include "internal/document/document_codec.hpp"
#include "internal/document/path.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/sink/sink_worker.hpp"

namespace profile::core {

using google::protobuf::Struct;
using google::protobuf::Value;
using profile::observability::IntField;
using profile::observability::StringField;
using profile::session::LockState;

namespace {

double MillisBetween(util::TimePoint from, util::TimePoint to) {
  return std::chrono::duration<double, std::milli>(to - from).count();
}

kv::RemoteStore& RequireStore(const ProfileContext& context) {
  if (!context.store || !context.templ) {
    throw std::invalid_argument("profile requires a store and a template");
  }
  return *context.store;
}

} // namespace

std::string_view ToString(LoadOutcome outcome) {
  switch (outcome) {
    case LoadOutcome::kCreated:
      return "created";
    case LoadOutcome::kClaimed:
      return "claimed";
    case LoadOutcome::kDegraded:
      return "degraded";
  }
  return "unknown";
}

std::string_view ToString(SaveResult result) {
  switch (result) {
    case SaveResult::kSaved:
      return "saved";
    case SaveResult::kSkipped:
      return "skipped";
    case SaveResult::kWriteFailed:
      return "write_failed";
    case SaveResult::kLedgerFailed:
      return "ledger_failed";
  }
  return "unknown";
}

Profile::Profile(std::string owner_id, ProfileContext context, util::CancellationToken token)
    : owner_id_(std::move(owner_id)),
      context_(std::move(context)),
      token_(std::move(token)),
      ledger_(RequireStore(context_), context_.options.store_name, context_.options.retry) {
  if (owner_id_.empty()) {
    throw std::invalid_argument("profile owner id is empty");
  }
  metadata_ = FreshMetadata(util::Now());
}

Profile::~Profile() {
  Close();
}

profile::store::v1::ProfileMetadata Profile::FreshMetadata(util::TimePoint now) const {
  profile::store::v1::ProfileMetadata metadata;
  *metadata.mutable_data() = context_.templ->Build(owner_id_);
  metadata.set_created(util::ToUnixMillis(now));
  metadata.set_sessions(1);
  return metadata;
}

// ------------------------------------------------------------------
// Load
// ------------------------------------------------------------------

LoadOutcome Profile::Load() {
  std::call_once(load_once_, [this] { load_outcome_ = DoLoad(); });
  return load_outcome_;
}

LoadOutcome Profile::DoLoad() {
  observability::SpanScope span("Profile.Load");
  span.SetAttribute("owner_id", owner_id_);

  {
    std::lock_guard lock(mutex_);
    state_ = LockState::kAcquiring;
  }

  if (!context_.options.persistence_enabled) {
    return Degrade("persistence disabled");
  }

  const auto                started = util::Now();
  session::StaleLockTracker tracker(context_.owner_token, context_.options.session_lock_timeout, started);
  bool                      wait_logged = false;

  while (true) {
    if (token_.IsCancelled()) {
      return Degrade("owner detached");
    }

    std::optional<std::int64_t> latest;
    auto                        result = ledger_.Latest(owner_id_, token_, &latest);
    if (!result) {
      span.RecordException(result.message);
      return Degrade(result.code == kv::ErrorCode::Cancelled ? "owner detached" : "version ledger unreachable");
    }

    if (!latest) {
      const auto now = util::Now();
      return Acquire(Claim{FreshMetadata(now), std::nullopt, true});
    }

    std::string bytes;
    result = kv::WithRetry(context_.options.retry, token_, "document.get", [&] {
      return context_.store->Get(context_.options.store_name, ledger::DocumentKey(owner_id_, *latest), &bytes);
    });
    if (!result) {
      span.RecordException(result.message);
      return Degrade(result.code == kv::ErrorCode::Cancelled ? "owner detached" : "latest version unreadable");
    }

    Claim       claim{{}, latest, false};
    std::string error;
    if (!document::Decode(bytes, &claim.metadata, &error)) {
      PROFILE_LOG_ERROR("stored profile is corrupt",
                        {StringField("owner_id", owner_id_), IntField("version", *latest), StringField("error", error)});
      span.RecordException(error);
      return Degrade("decode failed");
    }

    const auto verdict = tracker.Observe(claim.metadata, util::Now());
    if (verdict != session::LockVerdict::kHeld) {
      if (verdict == session::LockVerdict::kAbandoned) {
        PROFILE_LOG_WARN("taking over abandoned session lock",
                         {StringField("owner_id", owner_id_), StringField("holder", claim.metadata.session_data().owner_token()),
                          IntField("age_ms", tracker.LastAge().count()), IntField("waited_ms", tracker.Waited(util::Now()).count())});
      }
      observability::Metrics::Instance().ObserveLockWaitMs(MillisBetween(started, util::Now()));
      return Acquire(std::move(claim));
    }

    if (!wait_logged) {
      PROFILE_LOG_INFO("profile locked by another session, waiting",
                       {StringField("owner_id", owner_id_), StringField("holder", claim.metadata.session_data().owner_token()),
                        IntField("age_ms", tracker.LastAge().count())});
      wait_logged = true;
    }
    if (!token_.WaitFor(context_.options.session_check_interval)) {
      return Degrade("owner detached");
    }
  }
}

LoadOutcome Profile::Acquire(Claim claim) {
  SaveResult saved = SaveResult::kSkipped;
  {
    std::lock_guard save_lock(save_mutex_);
    if (closed_ || token_.IsCancelled()) {
      return Degrade("owner detached");
    }

    const auto now = util::Now();
    if (!claim.created) {
      claim.metadata.set_sessions(claim.metadata.sessions() + 1);
    }
    session::Stamp(&claim.metadata, context_.owner_token, now);

    {
      std::lock_guard lock(mutex_);
      metadata_     = std::move(claim.metadata);
      state_        = LockState::kLocked;
      is_new_       = claim.created;
      last_version_ = claim.base_version.value_or(0);
      last_save_    = now;
    }

    saved = SaveLocked(false);
  }

  if (saved != SaveResult::kSaved) {
    // the claim was never published, so the lock cannot be trusted
    return Degrade("claim save failed");
  }

  teardown_.Add("release-save", [this] { Save(true); });

  const auto outcome = claim.created ? LoadOutcome::kCreated : LoadOutcome::kClaimed;
  PROFILE_LOG_INFO("profile loaded", {StringField("owner_id", owner_id_), StringField("outcome", ToString(outcome)),
                                      IntField("sessions", Snapshot().sessions())});
  observability::Metrics::Instance().RecordLoad(ToString(outcome));
  return outcome;
}

LoadOutcome Profile::Degrade(std::string_view reason) {
  {
    std::lock_guard lock(mutex_);
    metadata_ = FreshMetadata(util::Now());
    state_    = LockState::kDegraded;
    is_new_   = true;
  }

  PROFILE_LOG_WARN("profile degraded to in-memory template", {StringField("owner_id", owner_id_), StringField("reason", reason)});
  observability::Metrics::Instance().RecordLoad(ToString(LoadOutcome::kDegraded));
  return LoadOutcome::kDegraded;
}

// ------------------------------------------------------------------
// Save
// ------------------------------------------------------------------

SaveResult Profile::Save(bool release_session) {
  std::lock_guard save_lock(save_mutex_);
  return SaveLocked(release_session);
}

SaveResult Profile::SaveIfDue(util::TimePoint now) {
  {
    std::lock_guard lock(mutex_);
    if (state_ != LockState::kLocked || now - last_save_ < context_.options.save_interval) {
      return SaveResult::kSkipped;
    }
  }
  return Save(false);
}

SaveResult Profile::SaveLocked(bool release_session) {
  observability::SpanScope span("Profile.Save");
  span.SetAttribute("owner_id", owner_id_);

  const auto                          started = util::Now();
  profile::store::v1::ProfileMetadata snapshot;
  std::int64_t                        version = 0;
  {
    std::lock_guard lock(mutex_);
    if (state_ != LockState::kLocked) {
      return SaveResult::kSkipped;
    }

    version = std::max(util::ToUnixMillis(started), last_version_ + 1);
    session::Stamp(&metadata_, context_.owner_token, started);
    snapshot = metadata_;
    snapshot.set_last_seen(util::ToUnixMillis(started));
    if (release_session) {
      state_ = LockState::kReleasing;
    }
  }
  span.SetAttribute("version", version);

  const auto restore_lock = [this, release_session] {
    if (!release_session) return;
    std::lock_guard lock(mutex_);
    if (state_ == LockState::kReleasing) state_ = LockState::kLocked;
  };

  std::string bytes;
  try {
    bytes = document::Encode(snapshot, {context_.options.keys_to_ignore, release_session});
  } catch (const std::runtime_error& e) {
    restore_lock();
    PROFILE_LOG_ERROR("profile encode failed", {StringField("owner_id", owner_id_), StringField("error", e.what())});
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordSave(ToString(SaveResult::kWriteFailed));
    return SaveResult::kWriteFailed;
  }

  // release-saves run after the owner token is cancelled
  const util::CancellationToken never;

  auto result = kv::WithRetry(context_.options.retry, never, "document.put", [&] {
    return context_.store->Put(context_.options.store_name, ledger::DocumentKey(owner_id_, version), bytes);
  });
  if (!result) {
    restore_lock();
    PROFILE_LOG_WARN("profile save failed", {StringField("owner_id", owner_id_), IntField("version", version),
                                             StringField("code", kv::ToString(result.code)), StringField("error", result.message)});
    span.RecordException(result.message);
    observability::Metrics::Instance().RecordSave(ToString(SaveResult::kWriteFailed));
    return SaveResult::kWriteFailed;
  }

  result = ledger_.Append(owner_id_, version, never);
  if (!result) {
    {
      std::lock_guard lock(mutex_);
      state_ = LockState::kDegraded;
    }
    PROFILE_LOG_ERROR("version ledger append failed, persistence disabled",
                      {StringField("owner_id", owner_id_), IntField("orphaned_version", version),
                       StringField("code", kv::ToString(result.code)), StringField("error", result.message)});
    span.RecordException(result.message);
    observability::Metrics::Instance().RecordSave(ToString(SaveResult::kLedgerFailed));
    return SaveResult::kLedgerFailed;
  }

  Struct saved_data;
  {
    std::lock_guard lock(mutex_);
    last_version_ = version;
    last_save_    = started;
    metadata_.set_last_seen(snapshot.last_seen());
    if (release_session) {
      session::Clear(&metadata_);
      state_ = LockState::kUnlocked;
    }
    saved_data = metadata_.data();
  }

  const auto finished = util::Now();
  observability::Metrics::Instance().RecordSave(ToString(SaveResult::kSaved));
  observability::Metrics::Instance().ObserveSaveLatencyMs(MillisBetween(started, finished));
  PROFILE_LOG_DEBUG("profile saved",
                    {StringField("owner_id", owner_id_), IntField("version", version), observability::BoolField("released", release_session)});

  notifier_.EmitSaved(saved_data);

  if (context_.sink) {
    context_.sink->Submit(sink::SinkRecord{context_.options.store_name, owner_id_, version, bytes});
  }
  return SaveResult::kSaved;
}

// ------------------------------------------------------------------
// Path API
// ------------------------------------------------------------------

std::optional<Value> Profile::Get(std::string_view path) const {
  std::lock_guard lock(mutex_);
  if (path.empty()) {
    Value whole;
    *whole.mutable_struct_value() = metadata_.data();
    return whole;
  }
  return document::Resolve(metadata_.data(), path);
}

bool Profile::ApplyMutation(std::string_view operation, std::string_view path, bool notify,
                            const std::function<bool(Struct*)>& mutate) {
  Struct changed;
  {
    std::lock_guard lock(mutex_);
    if (!mutate(metadata_.mutable_data())) {
      PROFILE_LOG_DEBUG("profile mutation rejected",
                        {StringField("owner_id", owner_id_), StringField("operation", operation), StringField("path", path)});
      return false;
    }
    if (notify) {
      changed = metadata_.data();
    }
  }

  if (notify) {
    notifier_.EmitChanged(changed);
  }
  return true;
}

bool Profile::Set(std::string_view path, const std::optional<Value>& value, bool notify) {
  return ApplyMutation("set", path, notify, [&](Struct* data) { return document::SetAt(data, path, value); });
}

bool Profile::SetMultiple(const std::map<std::string, std::optional<Value>>& values) {
  return ApplyMutation("set_multiple", {}, true, [&](Struct* data) {
    bool any = false;
    for (const auto& [path, value] : values) {
      any |= document::SetAt(data, path, value);
    }
    return any;
  });
}

bool Profile::Insert(std::string_view path, const Value& value) {
  return ApplyMutation("insert", path, true, [&](Struct* data) { return document::InsertAt(data, path, value); });
}

bool Profile::RemoveValue(std::string_view path, const Value& value) {
  return ApplyMutation("remove_value", path, true, [&](Struct* data) { return document::RemoveValueAt(data, path, value); });
}

bool Profile::RemoveValues(std::string_view path, const std::vector<Value>& values) {
  return ApplyMutation("remove_values", path, true, [&](Struct* data) {
    bool any = false;
    for (const auto& value : values) {
      any |= document::RemoveValueAt(data, path, value);
    }
    return any;
  });
}

bool Profile::Increment(std::string_view path, double delta) {
  return ApplyMutation("increment", path, true, [&](Struct* data) { return document::IncrementAt(data, path, delta); });
}

bool Profile::Reconcile() {
  const auto templ = context_.templ->Build(owner_id_);

  Struct changed;
  {
    std::lock_guard lock(mutex_);
    if (!document::ReconcileInto(metadata_.mutable_data(), templ)) {
      return false;
    }
    changed = metadata_.data();
  }

  PROFILE_LOG_DEBUG("profile reconciled with template", {StringField("owner_id", owner_id_)});
  notifier_.EmitChanged(changed);
  return true;
}

void Profile::Reset() {
  auto fresh = context_.templ->Build(owner_id_);
  ApplyMutation("reset", {}, true, [&](Struct* data) {
    *data = std::move(fresh);
    return true;
  });
}

// ------------------------------------------------------------------
// Lifecycle / accessors
// ------------------------------------------------------------------

void Profile::Close() {
  closed_ = true;
  teardown_.Run();
}

session::LockState Profile::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

bool Profile::IsNew() const {
  std::lock_guard lock(mutex_);
  return is_new_;
}

bool Profile::PersistenceEnabled() const {
  std::lock_guard lock(mutex_);
  return state_ == LockState::kLocked || state_ == LockState::kReleasing;
}

std::int64_t Profile::LastVersion() const {
  std::lock_guard lock(mutex_);
  return last_version_;
}

profile::store::v1::ProfileMetadata Profile::Snapshot() const {
  std::lock_guard lock(mutex_);
  return metadata_;
}

} // namespace profile::core
