#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

#include "internal/kv/api/result.hpp"

namespace profile::grpc {

/*
  Error translation at the transport edge.

    exception   -> Status   (server handlers)
    kv::Result <-> Status   (store service and its client)
*/

::grpc::Status ToStatus(const std::exception& e);
::grpc::Status ToStatus(const kv::Result& result);

kv::Result FromStatus(const ::grpc::Status& status);

} // namespace profile::grpc
