#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "profile/store/v1.hpp"

namespace {

google::protobuf::Value Number(double n) {
  google::protobuf::Value v;
  v.set_number_value(n);
  return v;
}

google::protobuf::Value Text(const std::string& s) {
  google::protobuf::Value v;
  v.set_string_value(s);
  return v;
}

std::string Render(const google::protobuf::Message& message) {
  std::string json;
  if (!google::protobuf::util::MessageToJsonString(message, &json).ok()) {
    return "<unprintable>";
  }
  return json;
}

constexpr const char* kDefaultConfig = R"(profiles:
  store_name: "ExampleData"
  save_interval: "2s"
  session_lock_timeout: "10s"
  template:
    coins: 0
    inventory: []
)";

} // namespace

int main(int argc, char** argv) {
  try {
    // in-memory store unless a config file names a backend
    const auto config = argc > 1 ? profile::config::ConfigLoader::LoadFromYaml(argv[1])
                                 : profile::config::ConfigLoader::LoadFromYamlString(kDefaultConfig);
    profile::observability::InitializeLogging(config);

    auto  app     = profile::factory::Build(config);
    auto& manager = *app.manager;

    const std::string owner_id = argc > 2 ? argv[2] : "player-1";
    auto              owner    = std::make_shared<profile::core::OwnerHandle>(owner_id);
    auto              profile  = manager.Attach(owner);

    std::cout << "loaded " << owner_id << " (" << profile::session::ToString(profile->State()) << ", "
              << (profile->IsNew() ? "new" : "returning") << ")\n";

    auto changed = profile->Events().OnChanged([](const google::protobuf::Struct& doc) { std::cout << "changed: " << Render(doc) << "\n"; });
    auto saved   = profile->Events().OnSaved([](const google::protobuf::Struct&) { std::cout << "saved\n"; });

    profile->Increment("coins", 25);
    profile->Insert("inventory", Text("sword"));
    profile->SetMultiple({{"settings", std::nullopt}, {"last_login", Number(static_cast<double>(profile::util::NowMillis()))}});

    const auto result = profile->Save();
    std::cout << "save: " << profile::core::ToString(result) << ", version " << profile->LastVersion() << "\n";

    // subscriptions go with the profile's teardown
    profile->Cleanup().Add(std::move(changed));
    profile->Cleanup().Add(std::move(saved));
    manager.Detach(owner_id);

    if (auto stored = manager.View(owner_id)) {
      profile::store::v1::ProfileMetadata latest = *stored;
      std::cout << "stored: " << Render(latest) << "\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "profile_session_example: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
