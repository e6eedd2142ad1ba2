#include "document_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace profile::document {

google::protobuf::Struct StripIgnored(const google::protobuf::Struct& data, const std::vector<std::string>& ignored_keys) {
  google::protobuf::Struct stripped = data;
  for (const auto& key : ignored_keys) {
    stripped.mutable_fields()->erase(key);
  }
  return stripped;
}

std::string Encode(const profile::store::v1::ProfileMetadata& metadata, const EncodeOptions& options) {
  profile::store::v1::ProfileMetadata persisted = metadata;
  if (!options.ignored_keys.empty()) {
    *persisted.mutable_data() = StripIgnored(metadata.data(), options.ignored_keys);
  }
  if (options.release_session) {
    persisted.clear_session_data();
  }

  std::string                               json;
  google::protobuf::util::JsonPrintOptions  print;
  print.preserve_proto_field_names = false;

  auto status = google::protobuf::util::MessageToJsonString(persisted, &json, print);
  if (!status.ok()) {
    throw std::runtime_error("encode profile: " + std::string(status.message()));
  }
  return json;
}

bool Decode(const std::string& bytes, profile::store::v1::ProfileMetadata* metadata, std::string* error) {
  metadata->Clear();

  const auto first = bytes.find_first_not_of(" \t\r\n");
  if (first == std::string::npos || bytes[first] != '{') {
    *error = "stored document is not a JSON object";
    return false;
  }

  // fields unknown to this build are skipped
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(bytes, metadata, options);
  if (!status.ok()) {
    metadata->Clear();
    *error = std::string(status.message());
    return false;
  }
  return true;
}

} // namespace profile::document
