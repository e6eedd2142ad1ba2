#include "internal/document/document_codec.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using profile::document::Decode;
using profile::document::Encode;
using profile::document::EncodeOptions;
using profile::document::StripIgnored;
using profile::store::v1::ProfileMetadata;

ProfileMetadata Sample() {
  ProfileMetadata metadata;
  auto*           fields = metadata.mutable_data()->mutable_fields();
  (*fields)["coins"].set_number_value(42);
  (*fields)["scratch"].set_string_value("volatile");
  metadata.set_created(1700000000000);
  metadata.set_last_seen(1700000005000);
  metadata.set_sessions(3);
  metadata.mutable_session_data()->set_last_update(1700000005000);
  metadata.mutable_session_data()->set_owner_token("token-a");
  return metadata;
}

void TestEncodeStripsIgnoredKeysFromCopyOnly() {
  const auto metadata = Sample();
  const auto bytes    = Encode(metadata, EncodeOptions{{"scratch"}, false});

  ProfileMetadata decoded;
  std::string     error;
  assert(Decode(bytes, &decoded, &error));
  assert(!decoded.data().fields().count("scratch"));
  assert(decoded.data().fields().at("coins").number_value() == 42);
  assert(metadata.data().fields().count("scratch"));

  assert(decoded.created() == metadata.created());
  assert(decoded.sessions() == 3);
  assert(decoded.session_data().owner_token() == "token-a");
}

void TestReleaseEncodeDropsSessionData() {
  const auto bytes = Encode(Sample(), EncodeOptions{{}, true});

  ProfileMetadata decoded;
  std::string     error;
  assert(Decode(bytes, &decoded, &error));
  assert(!decoded.has_session_data());
  assert(decoded.data().fields().count("scratch"));
}

void TestDecodeRejectsNonObjects() {
  ProfileMetadata decoded;
  std::string     error;

  assert(!Decode("", &decoded, &error));
  assert(!error.empty());

  error.clear();
  assert(!Decode("[1,2]", &decoded, &error));
  assert(!error.empty());

  error.clear();
  assert(!Decode("{\"data\": ", &decoded, &error));
  assert(!error.empty());

  error.clear();
  assert(!Decode("{\"sessions\": \"many\"}", &decoded, &error));
  assert(decoded.sessions() == 0);
}

void TestDecodeSkipsUnknownFields() {
  ProfileMetadata decoded;
  std::string     error;
  assert(Decode("  {\"sessions\": 2, \"writtenBy\": \"newer build\"}", &decoded, &error));
  assert(decoded.sessions() == 2);
}

void TestStripIgnored() {
  const auto stripped = StripIgnored(Sample().data(), {"scratch", "not-there"});
  assert(stripped.fields_size() == 1);
  assert(stripped.fields().count("coins"));
}

} // namespace

int main() {
  TestEncodeStripsIgnoredKeysFromCopyOnly();
  TestReleaseEncodeDropsSessionData();
  TestDecodeRejectsNonObjects();
  TestDecodeSkipsUnknownFields();
  TestStripIgnored();

  std::cout << "profile_store_unit_document_codec: pass\n";
  return 0;
}
