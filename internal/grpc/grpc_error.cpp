#include "grpc_error.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace profile::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace profile::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const Unavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const std::invalid_argument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

::grpc::Status ToStatus(const kv::Result& result) {
  switch (result.code) {
    case kv::ErrorCode::OK:
      return ::grpc::Status::OK;
    case kv::ErrorCode::NotFound:
      return {::grpc::StatusCode::NOT_FOUND, result.message};
    case kv::ErrorCode::Busy:
      return {::grpc::StatusCode::ABORTED, result.message};
    case kv::ErrorCode::IOError:
    case kv::ErrorCode::Unavailable:
      return {::grpc::StatusCode::UNAVAILABLE, result.message};
    case kv::ErrorCode::Corruption:
      return {::grpc::StatusCode::DATA_LOSS, result.message};
    case kv::ErrorCode::Cancelled:
      return {::grpc::StatusCode::CANCELLED, result.message};
    case kv::ErrorCode::InternalError:
      break;
  }
  return {::grpc::StatusCode::INTERNAL, result.message};
}

kv::Result FromStatus(const ::grpc::Status& status) {
  switch (status.error_code()) {
    case ::grpc::StatusCode::OK:
      return kv::Result::Ok();
    case ::grpc::StatusCode::NOT_FOUND:
      return kv::Result::Err(kv::ErrorCode::NotFound, status.error_message());
    case ::grpc::StatusCode::ABORTED:
      return kv::Result::Err(kv::ErrorCode::Busy, status.error_message());
    case ::grpc::StatusCode::UNAVAILABLE:
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
      return kv::Result::Err(kv::ErrorCode::Unavailable, status.error_message());
    case ::grpc::StatusCode::DATA_LOSS:
      return kv::Result::Err(kv::ErrorCode::Corruption, status.error_message());
    case ::grpc::StatusCode::CANCELLED:
      return kv::Result::Err(kv::ErrorCode::Cancelled, status.error_message());
    default:
      return kv::Result::Err(kv::ErrorCode::InternalError, status.error_message());
  }
}

} // namespace profile::grpc
