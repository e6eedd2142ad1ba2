#pragma once

#include <string>
#include <string_view>

namespace profile::kv {

/*
  Portable store result codes.

  Backends translate sqlite/pqxx/gRPC errors into these; nothing above the
  RemoteStore interface sees a backend error type.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  Busy,

  IOError,
  Corruption,

  Unavailable,
  Cancelled,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

inline std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Unavailable:
      return "unavailable";
    case ErrorCode::Cancelled:
      return "cancelled";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

} // namespace profile::kv
