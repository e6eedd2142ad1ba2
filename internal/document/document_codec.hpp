#pragma once

#include <string>
#include <vector>

#include "profile/store/v1/document.pb.h"

namespace profile::document {

/*
  ProfileMetadata <-> stored bytes.

  The stored form is the message's proto3 JSON. Encoding drops every
  top-level `data` key named in `ignored_keys`; the caller's in-memory
  document keeps them. A release encode also drops session_data.
*/

struct EncodeOptions {
  std::vector<std::string> ignored_keys;
  bool                     release_session{false};
};

// Throws std::runtime_error if the message cannot be rendered.
std::string Encode(const profile::store::v1::ProfileMetadata& metadata, const EncodeOptions& options);

// Returns false and fills `error` when `bytes` is not a JSON object of the
// expected shape. `metadata` is left cleared on failure.
bool Decode(const std::string& bytes, profile::store::v1::ProfileMetadata* metadata, std::string* error);

// The document with ignored keys removed, as it would be persisted.
google::protobuf::Struct StripIgnored(const google::protobuf::Struct& data, const std::vector<std::string>& ignored_keys);

} // namespace profile::document
