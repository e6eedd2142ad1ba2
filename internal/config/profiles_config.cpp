#include "profiles_config.hpp"

#include <stdexcept>

#include "internal/util/time.hpp"

namespace profile::config {

using profile::runtime::config::ProfilesConfig;

namespace {

constexpr std::chrono::milliseconds kDefaultSaveInterval{std::chrono::seconds(60)};
constexpr std::chrono::milliseconds kDefaultLockTimeout{std::chrono::seconds(300)};
constexpr std::chrono::milliseconds kDefaultCheckInterval{std::chrono::seconds(5)};
constexpr std::chrono::milliseconds kDefaultAttemptDelay{std::chrono::seconds(2)};
constexpr std::chrono::milliseconds kDefaultAutosaveTick{std::chrono::seconds(1)};
constexpr std::uint32_t             kDefaultAttempts = 5;

std::uint32_t Attempts(const ProfilesConfig& config) {
  return config.max_connection_attempts() == 0 ? kDefaultAttempts : config.max_connection_attempts();
}

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Invalid profiles config: " + message);
  }
}

} // namespace

void ValidateProfilesConfig(const ProfilesConfig& config) {
  Require(!config.store_name().empty(), "store_name must be set");
  Require(config.store_name().find('/') == std::string::npos, "store_name must not contain '/'");
  Require(Attempts(config) >= 1, "max_connection_attempts must be at least 1");

  const auto save_interval = util::FromProtoOr(config.save_interval(), kDefaultSaveInterval);
  const auto lock_timeout  = util::FromProtoOr(config.session_lock_timeout(), kDefaultLockTimeout);
  const auto check         = util::FromProtoOr(config.session_check_interval(), kDefaultCheckInterval);

  Require(save_interval.count() > 0, "save_interval must be positive");
  Require(lock_timeout > save_interval, "session_lock_timeout must exceed save_interval");
  Require(check.count() > 0, "session_check_interval must be positive");
  Require(util::FromProto(config.connection_attempt_delay()).count() >= 0, "connection_attempt_delay must not be negative");
}

std::string QualifiedStoreName(const ProfilesConfig& config) {
  if (config.store_version().empty()) {
    return config.store_name();
  }
  return config.store_name() + "/" + config.store_version();
}

bool PersistenceAllowed(const ProfilesConfig& config) {
  const bool enabled    = !config.has_persistence_enabled() || config.persistence_enabled();
  const bool production = config.environment() == profile::runtime::config::ENVIRONMENT_PRODUCTION ||
                          config.environment() == profile::runtime::config::ENVIRONMENT_UNSPECIFIED;
  return enabled && (production || config.allow_in_non_production());
}

core::ProfileOptions ToProfileOptions(const ProfilesConfig& config) {
  ValidateProfilesConfig(config);

  core::ProfileOptions options;
  options.store_name             = QualifiedStoreName(config);
  options.save_interval          = util::FromProtoOr(config.save_interval(), kDefaultSaveInterval);
  options.session_lock_timeout   = util::FromProtoOr(config.session_lock_timeout(), kDefaultLockTimeout);
  options.session_check_interval = util::FromProtoOr(config.session_check_interval(), kDefaultCheckInterval);
  options.retry.max_attempts     = Attempts(config);
  options.retry.delay            = util::FromProtoOr(config.connection_attempt_delay(), kDefaultAttemptDelay);
  options.keys_to_ignore.assign(config.keys_to_ignore().begin(), config.keys_to_ignore().end());
  options.persistence_enabled = PersistenceAllowed(config);
  return options;
}

std::chrono::milliseconds AutosaveTick(const ProfilesConfig& config) {
  return util::FromProtoOr(config.autosave_tick(), kDefaultAutosaveTick);
}

std::shared_ptr<const document::TemplateProvider> BuildTemplate(const ProfilesConfig& config) {
  return document::MakeFixedTemplate(config.template_());
}

} // namespace profile::config
