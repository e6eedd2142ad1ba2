#include "profile_manager.hpp"

#include <stdexcept>

#include "internal/document/document_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace profile::core {

using profile::observability::StringField;

namespace {

ProfileContext Gate(ProfileContext context, const kv::StoreHealth& health) {
  if (!context.store || !context.templ) {
    throw std::invalid_argument("profile manager requires a store and a template");
  }
  if (context.owner_token.empty()) {
    context.owner_token = util::GenerateToken();
  }
  if (!context.options.persistence_enabled) {
    PROFILE_LOG_INFO("profile persistence disabled by config", {StringField("store_name", context.options.store_name)});
  } else if (!health.reachable) {
    PROFILE_LOG_WARN("store health check failed, profiles will not persist", {StringField("detail", health.detail)});
    context.options.persistence_enabled = false;
  }
  return context;
}

} // namespace

OwnerHandle::OwnerHandle(std::string owner_id) : id_(std::move(owner_id)) {
}

ProfileManager::ProfileManager(ProfileContext context, kv::StoreHealth health, std::chrono::milliseconds autosave_tick)
    : context_(Gate(std::move(context), health)),
      ledger_(*context_.store, context_.options.store_name, context_.options.retry),
      scheduler_(autosave_tick) {
  scheduler_.Start();
}

ProfileManager::~ProfileManager() {
  DetachAll();
  scheduler_.Stop();
}

std::shared_ptr<Profile> ProfileManager::Attach(const std::shared_ptr<OwnerHandle>& owner) {
  if (!owner) {
    throw std::invalid_argument("attach requires a live owner");
  }

  std::shared_ptr<Profile> profile;
  bool                     inserted = false;
  {
    std::lock_guard lock(mutex_);
    auto            it = profiles_.find(owner->Id());
    if (it != profiles_.end()) {
      profile = it->second.profile;
    } else {
      profile = std::make_shared<Profile>(owner->Id(), context_, owner->Token());
      profiles_.emplace(owner->Id(), Entry{owner, profile});
      inserted = true;
    }
  }

  const auto outcome = profile->Load();
  if (inserted) {
    if (outcome != LoadOutcome::kDegraded) {
      ScheduleAutosave(profile);
    }
    UpdateActiveGauge();
  }
  return profile;
}

void ProfileManager::ScheduleAutosave(const std::shared_ptr<Profile>& profile) {
  std::weak_ptr<Profile> weak = profile;

  const auto handle = scheduler_.Register([weak](util::TimePoint now) {
    if (auto locked = weak.lock()) {
      locked->SaveIfDue(now);
    }
  });
  profile->Cleanup().Add("autosave", [this, handle] { scheduler_.Cancel(handle); });
}

std::shared_ptr<Profile> ProfileManager::Find(const std::string& owner_id) const {
  std::lock_guard lock(mutex_);
  auto            it = profiles_.find(owner_id);
  return it == profiles_.end() ? nullptr : it->second.profile;
}

bool ProfileManager::Detach(const std::string& owner_id) {
  Entry entry;
  {
    std::lock_guard lock(mutex_);
    auto            it = profiles_.find(owner_id);
    if (it == profiles_.end()) return false;
    entry = std::move(it->second);
    profiles_.erase(it);
  }

  entry.owner->Detach();
  entry.profile->Close();
  UpdateActiveGauge();
  return true;
}

void ProfileManager::DetachAll() {
  std::unordered_map<std::string, Entry> profiles;
  {
    std::lock_guard lock(mutex_);
    profiles.swap(profiles_);
  }

  for (auto& [owner_id, entry] : profiles) {
    entry.owner->Detach();
    entry.profile->Close();
  }
  UpdateActiveGauge();
}

std::optional<profile::store::v1::ProfileMetadata> ProfileManager::View(const std::string& owner_id) const {
  const util::CancellationToken never;

  std::optional<std::int64_t> latest;
  auto                        result = ledger_.Latest(owner_id, never, &latest);
  if (!result) {
    throw util::Unavailable("version ledger: " + result.message);
  }
  if (!latest) {
    return std::nullopt;
  }

  std::string bytes;
  result = kv::WithRetry(context_.options.retry, never, "document.get", [&] {
    return context_.store->Get(context_.options.store_name, ledger::DocumentKey(owner_id, *latest), &bytes);
  });
  if (result.code == kv::ErrorCode::NotFound) {
    throw util::NotFound("version " + std::to_string(*latest) + " of " + owner_id + " is missing");
  }
  if (!result) {
    throw util::Unavailable("document read: " + result.message);
  }

  profile::store::v1::ProfileMetadata metadata;
  std::string                         error;
  if (!document::Decode(bytes, &metadata, &error)) {
    throw std::runtime_error("stored profile " + owner_id + " is corrupt: " + error);
  }
  return metadata;
}

std::vector<std::int64_t> ProfileManager::Versions(const std::string& owner_id, std::size_t limit) const {
  std::vector<std::int64_t> versions;
  auto                      result = ledger_.List(owner_id, limit, util::CancellationToken{}, &versions);
  if (!result) {
    throw util::Unavailable("version ledger: " + result.message);
  }
  return versions;
}

std::size_t ProfileManager::Size() const {
  std::lock_guard lock(mutex_);
  return profiles_.size();
}

void ProfileManager::UpdateActiveGauge() const {
  observability::Metrics::Instance().SetActiveProfiles(Size());
}

} // namespace profile::core
