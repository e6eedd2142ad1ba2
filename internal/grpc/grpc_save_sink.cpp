#include "grpc_save_sink.hpp"

#include "internal/util/errors.hpp"

namespace profile::grpc {

GrpcSaveSink::GrpcSaveSink(const std::string& target, std::chrono::milliseconds deadline)
    : target_(target),
      stub_(profile::store::v1::ProfileSinkService::NewStub(::grpc::CreateChannel(target, ::grpc::InsecureChannelCredentials()))),
      deadline_(deadline.count() > 0 ? deadline : std::chrono::seconds(5)) {
}

void GrpcSaveSink::Forward(const sink::SinkRecord& record) {
  profile::store::v1::ForwardRequest req;
  req.set_store_name(record.store_name);
  req.set_owner_id(record.owner_id);
  req.set_version(record.version);
  req.set_document_json(record.document_json);

  google::protobuf::Empty resp;
  ::grpc::ClientContext    context;
  context.set_deadline(std::chrono::system_clock::now() + deadline_);

  auto status = stub_->Forward(&context, req, &resp);
  if (!status.ok()) {
    throw util::Unavailable("sink " + target_ + ": " + status.error_message());
  }
}

} // namespace profile::grpc
