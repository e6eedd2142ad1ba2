#pragma once

#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace profile::document {

/*
  Dotted-path engine over google.protobuf.Struct.

  Every segment names a struct field. Two sentinels are recognised as the
  final segment of SetAt:

    a.list.++   append the value to the list at a.list
    a.list.--   remove the element at the 1-based index given by the value

  Failures (missing parent, wrong node type, bad index) return false and
  leave the document untouched.
*/

inline constexpr std::string_view kAppendSegment = "++";
inline constexpr std::string_view kRemoveSegment = "--";

// Empty optional for a malformed path (empty segment).
std::optional<std::vector<std::string>> SplitPath(std::string_view path);

std::optional<google::protobuf::Value> Resolve(const google::protobuf::Struct& root, std::string_view path);

// `value == nullopt` erases the key.
bool SetAt(google::protobuf::Struct* root, std::string_view path, const std::optional<google::protobuf::Value>& value);

bool InsertAt(google::protobuf::Struct* root, std::string_view path, const google::protobuf::Value& value);

// Removes the first element deep-equal to `value`.
bool RemoveValueAt(google::protobuf::Struct* root, std::string_view path, const google::protobuf::Value& value);

bool IncrementAt(google::protobuf::Struct* root, std::string_view path, double delta);

// Copies template keys missing from `root`, recursing into nested structs.
// Never overwrites or removes. Returns true if anything was added.
bool ReconcileInto(google::protobuf::Struct* root, const google::protobuf::Struct& templ);

bool ValuesEqual(const google::protobuf::Value& lhs, const google::protobuf::Value& rhs);

} // namespace profile::document
