#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace profile::config {
namespace {

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  // quoted scalars carry the non-specific "!" tag and always stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar);
    return;
  }

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }
  if (scalar == "~" || scalar == "null") {
    value->set_null_value(google::protobuf::NULL_VALUE);
    return;
  }

  char*        end    = nullptr;
  const double number = std::strtod(scalar.c_str(), &end);
  if (!scalar.empty() && end && *end == '\0') {
    value->set_number_value(number);
    return;
  }

  value->set_string_value(scalar);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (const auto& item : node) {
        YamlToProtoValue(item, list->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        YamlToProtoValue(entry.second, &(*fields)[entry.first.as<std::string>()]);
      }
      break;
    }
  }
}

profile::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  profile::runtime::config::RuntimeConfig config;
  if (!yaml || yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value root;
  YamlToProtoValue(yaml, &root);

  std::string json;
  auto        to_json = google::protobuf::util::MessageToJsonString(root, &json);
  if (!to_json.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }
  return config;
}

} // namespace

profile::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + e.what());
  }
  return FromYamlNode(yaml);
}

profile::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

} // namespace profile::config
