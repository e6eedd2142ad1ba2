#pragma once

#include <stdexcept>
#include <string>

namespace profile::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace profile::util
