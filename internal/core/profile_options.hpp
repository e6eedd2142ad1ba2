#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/document/template.hpp"
#include "internal/kv/api/remote_store.hpp"
#include "internal/kv/retry.hpp"

namespace profile::sink {
class SinkDispatcher;
}

namespace profile::core {

struct ProfileOptions {
  // "<store_name>/<store_version>"
  std::string store_name;

  std::chrono::milliseconds save_interval{std::chrono::seconds(60)};
  std::chrono::milliseconds session_lock_timeout{std::chrono::seconds(300)};
  std::chrono::milliseconds session_check_interval{std::chrono::seconds(5)};

  kv::RetryPolicy retry{};

  std::vector<std::string> keys_to_ignore;

  bool persistence_enabled{true};
};

/*
  Collaborators shared by every profile of one manager.
  `sink` may be null.
*/
struct ProfileContext {
  std::shared_ptr<kv::RemoteStore>                  store;
  std::shared_ptr<const document::TemplateProvider> templ;
  std::shared_ptr<sink::SinkDispatcher>             sink;

  // Stamped into session locks taken by this process.
  std::string owner_token;

  ProfileOptions options;
};

} // namespace profile::core
