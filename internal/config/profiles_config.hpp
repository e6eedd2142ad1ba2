#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/core/profile_options.hpp"
#include "internal/document/template.hpp"

namespace profile::config {

/*
  Effective profile settings derived from RuntimeConfig.profiles.

  Unset durations and counts fall back to:

    save_interval             60s
    session_lock_timeout      300s
    session_check_interval    5s
    max_connection_attempts   5
    connection_attempt_delay  2s
    autosave_tick             1s
*/

// Throws std::runtime_error describing the first violated rule.
void ValidateProfilesConfig(const profile::runtime::config::ProfilesConfig& config);

// "<store_name>/<store_version>", or just the name when no version is set.
std::string QualifiedStoreName(const profile::runtime::config::ProfilesConfig& config);

// persistence_enabled && (production || allow_in_non_production); store
// health is applied later by the manager.
bool PersistenceAllowed(const profile::runtime::config::ProfilesConfig& config);

// Validates, then converts.
core::ProfileOptions ToProfileOptions(const profile::runtime::config::ProfilesConfig& config);

std::chrono::milliseconds AutosaveTick(const profile::runtime::config::ProfilesConfig& config);

std::shared_ptr<const document::TemplateProvider> BuildTemplate(const profile::runtime::config::ProfilesConfig& config);

} // namespace profile::config
