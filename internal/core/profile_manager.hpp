#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/kv/api/store_health.hpp"
#include "internal/scheduler/autosave_scheduler.hpp"
#include "internal/util/cancellation.hpp"
#include "profile.hpp"

namespace profile::core {

/*
  OwnerHandle

  Live reference to the entity a profile belongs to. Detach() cancels the
  owner's token, which aborts a pending lock wait or store retry.
*/
class OwnerHandle {
 public:
  explicit OwnerHandle(std::string owner_id);

  const std::string& Id() const {
    return id_;
  }

  util::CancellationToken Token() const {
    return source_.Token();
  }

  void Detach() {
    source_.Cancel();
  }

  bool Detached() const {
    return source_.IsCancelled();
  }

 private:
  std::string              id_;
  util::CancellationSource source_;
};

/*
  ProfileManager

  Registry of the profiles loaded by this process, at most one per owner id,
  plus the autosave scheduler they share. Persistence is enabled only when
  both the options and the injected store health allow it.
*/
class ProfileManager {
 public:
  ProfileManager(ProfileContext context, kv::StoreHealth health, std::chrono::milliseconds autosave_tick = std::chrono::seconds(1));
  ~ProfileManager();

  ProfileManager(const ProfileManager&)            = delete;
  ProfileManager& operator=(const ProfileManager&) = delete;

  // Returns the loaded profile for the owner, loading it on first attach.
  // Blocks while another session holds the lock. Throws std::invalid_argument
  // for a null owner.
  std::shared_ptr<Profile> Attach(const std::shared_ptr<OwnerHandle>& owner);

  std::shared_ptr<Profile> Find(const std::string& owner_id) const;

  // Cancels the owner, stops autosave and issues the release-save.
  bool Detach(const std::string& owner_id);
  void DetachAll();

  // Latest stored document, read without touching the lock. Empty when the
  // owner has never been saved. Throws util::Unavailable / std::runtime_error.
  std::optional<profile::store::v1::ProfileMetadata> View(const std::string& owner_id) const;

  // Version ids, newest first. Throws util::Unavailable.
  std::vector<std::int64_t> Versions(const std::string& owner_id, std::size_t limit) const;

  const std::string& OwnerToken() const {
    return context_.owner_token;
  }

  bool PersistenceEnabled() const {
    return context_.options.persistence_enabled;
  }

  std::size_t Size() const;

  scheduler::AutosaveScheduler& Scheduler() {
    return scheduler_;
  }

 private:
  struct Entry {
    std::shared_ptr<OwnerHandle> owner;
    std::shared_ptr<Profile>     profile;
  };

  void ScheduleAutosave(const std::shared_ptr<Profile>& profile);
  void UpdateActiveGauge() const;

  ProfileContext               context_;
  ledger::VersionLedger        ledger_;
  scheduler::AutosaveScheduler scheduler_;

  mutable std::mutex                     mutex_;
  std::unordered_map<std::string, Entry> profiles_;
};

} // namespace profile::core
