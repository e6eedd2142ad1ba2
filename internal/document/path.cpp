#include "path.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <cmath>

namespace profile::document {
namespace {

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

// Walks `segments` as struct fields and returns the node, or nullptr.
Value* MutableNode(Struct* root, const std::vector<std::string>& segments, std::size_t count) {
  Struct* current = root;
  Value*  node    = nullptr;
  for (std::size_t i = 0; i < count; ++i) {
    if (!current) return nullptr;
    auto* fields = current->mutable_fields();
    auto  it     = fields->find(segments[i]);
    if (it == fields->end()) return nullptr;
    node    = &it->second;
    current = node->kind_case() == Value::kStructValue ? node->mutable_struct_value() : nullptr;
  }
  return node;
}

// Struct that holds the last segment; the root itself for a one-segment path.
Struct* MutableParent(Struct* root, const std::vector<std::string>& segments) {
  if (segments.size() == 1) return root;
  Value* parent = MutableNode(root, segments, segments.size() - 1);
  if (!parent || parent->kind_case() != Value::kStructValue) return nullptr;
  return parent->mutable_struct_value();
}

ListValue* MutableList(Struct* root, const std::vector<std::string>& segments, std::size_t count) {
  if (count == 0) return nullptr;
  Value* node = MutableNode(root, segments, count);
  if (!node || node->kind_case() != Value::kListValue) return nullptr;
  return node->mutable_list_value();
}

bool AppendToList(Struct* root, const std::vector<std::string>& segments, const std::optional<Value>& value) {
  if (!value) return false;
  ListValue* list = MutableList(root, segments, segments.size() - 1);
  if (!list) return false;
  *list->add_values() = *value;
  return true;
}

bool RemoveListIndex(Struct* root, const std::vector<std::string>& segments, const std::optional<Value>& value) {
  if (!value || value->kind_case() != Value::kNumberValue) return false;
  ListValue* list = MutableList(root, segments, segments.size() - 1);
  if (!list) return false;

  const double index = value->number_value();
  if (index != std::floor(index) || index < 1 || index > list->values_size()) return false;

  list->mutable_values()->erase(list->mutable_values()->begin() + static_cast<int>(index) - 1);
  return true;
}

} // namespace

std::optional<std::vector<std::string>> SplitPath(std::string_view path) {
  std::vector<std::string> segments;
  std::size_t              start = 0;
  while (true) {
    const auto dot     = path.find('.', start);
    const auto segment = path.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
    if (segment.empty()) return std::nullopt;
    segments.emplace_back(segment);
    if (dot == std::string_view::npos) break;
    start = dot + 1;
  }
  return segments;
}

std::optional<Value> Resolve(const Struct& root, std::string_view path) {
  auto segments = SplitPath(path);
  if (!segments) return std::nullopt;

  const Struct* current = &root;
  const Value*  node    = nullptr;
  for (const auto& segment : *segments) {
    if (!current) return std::nullopt;
    auto it = current->fields().find(segment);
    if (it == current->fields().end()) return std::nullopt;
    node    = &it->second;
    current = node->kind_case() == Value::kStructValue ? &node->struct_value() : nullptr;
  }
  return *node;
}

bool SetAt(Struct* root, std::string_view path, const std::optional<Value>& value) {
  auto segments = SplitPath(path);
  if (!segments) return false;

  const auto& last = segments->back();
  if (last == kAppendSegment) return AppendToList(root, *segments, value);
  if (last == kRemoveSegment) return RemoveListIndex(root, *segments, value);

  Struct* parent = MutableParent(root, *segments);
  if (!parent) return false;

  if (!value) {
    parent->mutable_fields()->erase(last);
    return true;
  }
  (*parent->mutable_fields())[last] = *value;
  return true;
}

bool InsertAt(Struct* root, std::string_view path, const Value& value) {
  auto segments = SplitPath(path);
  if (!segments) return false;
  ListValue* list = MutableList(root, *segments, segments->size());
  if (!list) return false;
  *list->add_values() = value;
  return true;
}

bool RemoveValueAt(Struct* root, std::string_view path, const Value& value) {
  auto segments = SplitPath(path);
  if (!segments) return false;
  ListValue* list = MutableList(root, *segments, segments->size());
  if (!list) return false;

  auto* values = list->mutable_values();
  for (auto it = values->begin(); it != values->end(); ++it) {
    if (ValuesEqual(*it, value)) {
      values->erase(it);
      return true;
    }
  }
  return false;
}

bool IncrementAt(Struct* root, std::string_view path, double delta) {
  auto segments = SplitPath(path);
  if (!segments) return false;
  Value* node = MutableNode(root, *segments, segments->size());
  if (!node || node->kind_case() != Value::kNumberValue) return false;
  node->set_number_value(node->number_value() + delta);
  return true;
}

bool ReconcileInto(Struct* root, const Struct& templ) {
  bool changed = false;
  for (const auto& [key, templ_value] : templ.fields()) {
    auto* fields = root->mutable_fields();
    auto  it     = fields->find(key);
    if (it == fields->end()) {
      (*fields)[key] = templ_value;
      changed        = true;
      continue;
    }
    if (templ_value.kind_case() == Value::kStructValue && it->second.kind_case() == Value::kStructValue) {
      changed |= ReconcileInto(it->second.mutable_struct_value(), templ_value.struct_value());
    }
  }
  return changed;
}

bool ValuesEqual(const Value& lhs, const Value& rhs) {
  return google::protobuf::util::MessageDifferencer::Equals(lhs, rhs);
}

} // namespace profile::document
