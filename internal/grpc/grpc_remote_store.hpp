#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/kv/api/remote_store.hpp"
#include "profile/store/v1/store_service.grpc.pb.h"

namespace profile::grpc {

/*
  RemoteStore client for a profile-store-server. Every call carries its own
  deadline; transport failures come back as kv::ErrorCode::Unavailable.
*/
class GrpcRemoteStore final : public kv::RemoteStore {
 public:
  GrpcRemoteStore(const std::string& target, std::chrono::milliseconds deadline);
  GrpcRemoteStore(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline);

  kv::Result Get(const std::string& name, const std::string& key, std::string* value) override;
  kv::Result Put(const std::string& name, const std::string& key, const std::string& value) override;
  kv::Result ListSorted(const std::string& name, const std::string& scope, bool descending, std::size_t page_size,
                        std::vector<std::int64_t>* versions) override;
  kv::Result Append(const std::string& name, const std::string& scope, std::int64_t version) override;

 private:
  void PrepareContext(::grpc::ClientContext* context) const;

  std::unique_ptr<profile::store::v1::RemoteStoreService::Stub> stub_;
  std::chrono::milliseconds                                     deadline_;
};

} // namespace profile::grpc
