#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/sink/save_sink.hpp"
#include "profile/store/v1/sink_service.grpc.pb.h"

namespace profile::grpc {

// Forwards saved documents to a ProfileSinkService endpoint.
class GrpcSaveSink final : public sink::SaveSink {
 public:
  GrpcSaveSink(const std::string& target, std::chrono::milliseconds deadline);

  // Throws util::Unavailable on any non-OK status.
  void Forward(const sink::SinkRecord& record) override;

 private:
  std::string                                                   target_;
  std::unique_ptr<profile::store::v1::ProfileSinkService::Stub> stub_;
  std::chrono::milliseconds                                     deadline_;
};

} // namespace profile::grpc
