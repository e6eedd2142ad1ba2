#include "grpc_remote_store.hpp"

#include "grpc_error.hpp"

namespace profile::grpc {

using namespace profile::store::v1;

GrpcRemoteStore::GrpcRemoteStore(const std::string& target, std::chrono::milliseconds deadline)
    : GrpcRemoteStore(::grpc::CreateChannel(target, ::grpc::InsecureChannelCredentials()), deadline) {
}

GrpcRemoteStore::GrpcRemoteStore(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline)
    : stub_(RemoteStoreService::NewStub(std::move(channel))), deadline_(deadline.count() > 0 ? deadline : std::chrono::seconds(5)) {
}

void GrpcRemoteStore::PrepareContext(::grpc::ClientContext* context) const {
  context->set_deadline(std::chrono::system_clock::now() + deadline_);
}

kv::Result GrpcRemoteStore::Get(const std::string& name, const std::string& key, std::string* value) {
  GetRequest req;
  req.set_name(name);
  req.set_key(key);

  GetResponse          resp;
  ::grpc::ClientContext context;
  PrepareContext(&context);

  auto result = FromStatus(stub_->Get(&context, req, &resp));
  if (result) {
    *value = std::move(*resp.mutable_value());
  }
  return result;
}

kv::Result GrpcRemoteStore::Put(const std::string& name, const std::string& key, const std::string& value) {
  PutRequest req;
  req.set_name(name);
  req.set_key(key);
  req.set_value(value);

  google::protobuf::Empty resp;
  ::grpc::ClientContext    context;
  PrepareContext(&context);
  return FromStatus(stub_->Put(&context, req, &resp));
}

kv::Result GrpcRemoteStore::ListSorted(const std::string& name, const std::string& scope, bool descending, std::size_t page_size,
                                       std::vector<std::int64_t>* versions) {
  ListVersionsRequest req;
  req.set_name(name);
  req.set_scope(scope);
  req.set_descending(descending);
  req.set_page_size(static_cast<std::uint32_t>(page_size));

  ListVersionsResponse  resp;
  ::grpc::ClientContext context;
  PrepareContext(&context);

  auto result = FromStatus(stub_->ListVersions(&context, req, &resp));
  if (result) {
    versions->assign(resp.versions().begin(), resp.versions().end());
  }
  return result;
}

kv::Result GrpcRemoteStore::Append(const std::string& name, const std::string& scope, std::int64_t version) {
  AppendVersionRequest req;
  req.set_name(name);
  req.set_scope(scope);
  req.set_version(version);

  google::protobuf::Empty resp;
  ::grpc::ClientContext    context;
  PrepareContext(&context);
  return FromStatus(stub_->AppendVersion(&context, req, &resp));
}

} // namespace profile::grpc
