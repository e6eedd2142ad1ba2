#include "store_server.hpp"

#include <cstdint>
#include <vector>

#include "grpc_error.hpp"

namespace profile::grpc {

using namespace profile::store::v1;

namespace {

::grpc::Status RequireName(const std::string& name) {
  if (name.empty()) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, "store name is required"};
  }
  return ::grpc::Status::OK;
}

} // namespace

StoreServer::StoreServer(std::shared_ptr<kv::RemoteStore> store) : store_(std::move(store)) {
}

::grpc::Status StoreServer::Get(::grpc::ServerContext*, const GetRequest* req, GetResponse* resp) {
  if (auto status = RequireName(req->name()); !status.ok()) return status;
  return ToStatus(store_->Get(req->name(), req->key(), resp->mutable_value()));
}

::grpc::Status StoreServer::Put(::grpc::ServerContext*, const PutRequest* req, google::protobuf::Empty*) {
  if (auto status = RequireName(req->name()); !status.ok()) return status;
  return ToStatus(store_->Put(req->name(), req->key(), req->value()));
}

::grpc::Status StoreServer::ListVersions(::grpc::ServerContext*, const ListVersionsRequest* req, ListVersionsResponse* resp) {
  if (auto status = RequireName(req->name()); !status.ok()) return status;

  std::vector<std::int64_t> versions;
  auto                      result = store_->ListSorted(req->name(), req->scope(), req->descending(), req->page_size(), &versions);
  if (!result) return ToStatus(result);

  resp->mutable_versions()->Add(versions.begin(), versions.end());
  return ::grpc::Status::OK;
}

::grpc::Status StoreServer::AppendVersion(::grpc::ServerContext*, const AppendVersionRequest* req, google::protobuf::Empty*) {
  if (auto status = RequireName(req->name()); !status.ok()) return status;
  return ToStatus(store_->Append(req->name(), req->scope(), req->version()));
}

} // namespace profile::grpc
