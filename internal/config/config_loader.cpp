#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace strata::config {

using strata::runtime::config::RuntimeConfig;

namespace {

google::protobuf::Value ScalarValue(const YAML::Node& node) {
  google::protobuf::Value value;
  const auto&             text = node.Scalar();

  // "8080" written quoted must reach protobuf as a string
  if (node.Tag() == "!") {
    value.set_string_value(text);
    return value;
  }
  if (text == "true" || text == "false") {
    value.set_bool_value(text == "true");
    return value;
  }

  char*        end    = nullptr;
  const double number = std::strtod(text.c_str(), &end);
  if (!text.empty() && end && *end == '\0') {
    value.set_number_value(number);
  } else {
    value.set_string_value(text);
  }
  return value;
}

google::protobuf::Value ToValue(const YAML::Node& node) {
  google::protobuf::Value value;
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      value.set_null_value(google::protobuf::NULL_VALUE);
      return value;
    case YAML::NodeType::Scalar:
      return ScalarValue(node);
    case YAML::NodeType::Sequence:
      for (const auto& item : node) {
        *value.mutable_list_value()->add_values() = ToValue(item);
      }
      return value;
    case YAML::NodeType::Map:
      for (const auto& entry : node) {
        (*value.mutable_struct_value()->mutable_fields())[entry.first.Scalar()] = ToValue(entry.second);
      }
      return value;
  }
  throw std::runtime_error("unsupported YAML node");
}

void ApplyEnvironment(RuntimeConfig& config) {
  if (const char* uri = std::getenv("STRATA_DATABASE_URI")) {
    config.mutable_database()->mutable_postgres()->set_connection_uri(uri);
  }
}

RuntimeConfig Parse(const YAML::Node& document, const std::string& source) {
  RuntimeConfig config;

  // empty document: every field keeps its default
  if (document.IsDefined() && !document.IsNull()) {
    if (!document.IsMap()) {
      throw std::runtime_error(source + ": top level must be a mapping");
    }

    std::string json;
    if (auto status = google::protobuf::util::MessageToJsonString(ToValue(document), &json); !status.ok()) {
      throw std::runtime_error(source + ": " + std::string(status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;
    if (auto status = google::protobuf::util::JsonStringToMessage(json, &config, options); !status.ok()) {
      throw std::runtime_error(source + ": invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyEnvironment(config);
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node document;
  try {
    document = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(path + ": " + e.what());
  }
  return Parse(document, path);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml) {
  YAML::Node document;
  try {
    document = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("<string>: ") + e.what());
  }
  return Parse(document, "<string>");
}

} // namespace strata::config
