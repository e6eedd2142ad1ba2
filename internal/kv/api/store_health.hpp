#pragma once

#include <string>

namespace profile::kv {

// Outcome of the startup reachability probe, injected into the profile manager.
struct StoreHealth {
  bool        reachable{false};
  std::string detail;

  static StoreHealth Healthy() {
    return {true, {}};
  }
};

} // namespace profile::kv
