#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/profile_manager.hpp"
#include "internal/document/path.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using profile::core::LoadOutcome;
using profile::core::ProfileManager;
using profile::core::SaveResult;

static void Usage() {
  std::cout << "Usage:\n"
            << "  profilectl --config <cfg.yaml> view <owner>\n"
            << "  profilectl --config <cfg.yaml> versions <owner> [limit]\n"
            << "  profilectl --config <cfg.yaml> get <owner> [path]\n"
            << "  profilectl --config <cfg.yaml> set <owner> <path> <json>\n"
            << "  profilectl --config <cfg.yaml> increment <owner> <path> <delta>\n";
}

static std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("render json: " + std::string(status.message()));
  }
  return json;
}

static google::protobuf::Value ParseValue(const std::string& json) {
  google::protobuf::Value value;
  auto                    status = google::protobuf::util::JsonStringToMessage(json, &value);
  if (!status.ok()) {
    throw std::invalid_argument("invalid JSON value '" + json + "': " + std::string(status.message()));
  }
  return value;
}

static int View(ProfileManager& manager, const std::string& owner) {
  auto metadata = manager.View(owner);
  if (!metadata) {
    std::cerr << "no saved profile for " << owner << "\n";
    return 3;
  }
  std::cout << ToJson(*metadata);
  return 0;
}

static int Versions(ProfileManager& manager, const std::string& owner, std::size_t limit) {
  for (auto version : manager.Versions(owner, limit)) {
    std::cout << version << "\n";
  }
  return 0;
}

static int Get(ProfileManager& manager, const std::string& owner, const std::string& path) {
  auto metadata = manager.View(owner);
  if (!metadata) {
    std::cerr << "no saved profile for " << owner << "\n";
    return 3;
  }
  if (path.empty()) {
    std::cout << ToJson(metadata->data());
    return 0;
  }

  auto value = profile::document::Resolve(metadata->data(), path);
  if (!value) {
    std::cerr << "path not found: " << path << "\n";
    return 3;
  }
  std::cout << ToJson(*value) << "\n";
  return 0;
}

// Attaches (taking the session lock), applies `mutate`, then detaches with a release-save.
template <typename Mutation>
static int Mutate(ProfileManager& manager, const std::string& owner_id, Mutation mutate) {
  auto owner   = std::make_shared<profile::core::OwnerHandle>(owner_id);
  auto profile = manager.Attach(owner);
  if (profile->State() != profile::session::LockState::kLocked) {
    std::cerr << "could not take the session lock for " << owner_id << "; nothing written\n";
    manager.Detach(owner_id);
    return 4;
  }

  if (!mutate(*profile)) {
    std::cerr << "mutation rejected\n";
    manager.Detach(owner_id);
    return 3;
  }

  // release-save through the normal save path so failures are visible here
  const auto result = profile->Save(true);
  manager.Detach(owner_id);
  if (result != SaveResult::kSaved) {
    std::cerr << "save failed: " << profile::core::ToString(result) << "\n";
    return 5;
  }
  std::cout << "saved version " << profile->LastVersion() << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 5 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string              config_path = argv[2];
  const std::string              command     = argv[3];
  const std::string              owner       = argv[4];
  const std::vector<std::string> args(argv + 5, argv + argc);

  try {
    auto config = profile::config::ConfigLoader::LoadFromYaml(config_path);
    profile::observability::InitializeLogging(config);

    auto  app     = profile::factory::Build(config);
    auto& manager = *app.manager;

    int rc = 1;
    if (command == "view") {
      rc = View(manager, owner);
    } else if (command == "versions") {
      rc = Versions(manager, owner, args.empty() ? 10 : std::stoul(args[0]));
    } else if (command == "get") {
      rc = Get(manager, owner, args.empty() ? std::string() : args[0]);
    } else if (command == "set" && args.size() == 2) {
      const auto value = ParseValue(args[1]);
      rc = Mutate(manager, owner, [&](profile::core::Profile& p) { return p.Set(args[0], value); });
    } else if (command == "increment" && args.size() == 2) {
      const double delta = std::stod(args[1]);
      rc = Mutate(manager, owner, [&](profile::core::Profile& p) { return p.Increment(args[0], delta); });
    } else {
      Usage();
    }

    profile::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    std::cerr << "profilectl: " << e.what() << "\n";
    profile::observability::ShutdownLogging();
    return 2;
  }
}
