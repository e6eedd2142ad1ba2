#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace profile::util {

/*
  UUID helpers

  Used for the per-process owner token stamped into session locks.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// "<host>/<pid>/<uuid v4>", or the bare uuid when the host name is unknown.
// Shows up as `holder` in lock-wait logs.
std::string GenerateToken();

} // namespace profile::util
