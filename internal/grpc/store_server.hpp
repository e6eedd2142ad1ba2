#pragma once

#include <memory>

#include "internal/kv/api/remote_store.hpp"
#include "profile/store/v1/store_service.grpc.pb.h"

namespace profile::grpc {

// Serves a local RemoteStore backend to profile processes on other hosts.
class StoreServer final : public profile::store::v1::RemoteStoreService::Service {
 public:
  explicit StoreServer(std::shared_ptr<kv::RemoteStore> store);

  ::grpc::Status Get(::grpc::ServerContext* ctx, const profile::store::v1::GetRequest* req, profile::store::v1::GetResponse* resp) override;
  ::grpc::Status Put(::grpc::ServerContext* ctx, const profile::store::v1::PutRequest* req, google::protobuf::Empty* resp) override;
  ::grpc::Status ListVersions(::grpc::ServerContext* ctx, const profile::store::v1::ListVersionsRequest* req,
                              profile::store::v1::ListVersionsResponse* resp) override;
  ::grpc::Status AppendVersion(::grpc::ServerContext* ctx, const profile::store::v1::AppendVersionRequest* req,
                               google::protobuf::Empty* resp) override;

 private:
  std::shared_ptr<kv::RemoteStore> store_;
};

} // namespace profile::grpc
