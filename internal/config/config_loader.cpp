#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace artscan::config {

namespace {

using google::protobuf::Value;

// yaml-cpp tags plain scalars "?" and quoted ones "!". Only plain scalars
// are typed, so a quoted "12345" stays a string.
void ConvertScalar(const YAML::Node& node, Value* out) {
  const std::string& text = node.Scalar();
  if (node.Tag() == "!" || text.empty()) {
    out->set_string_value(text);
    return;
  }
  if (text == "true" || text == "false") {
    out->set_bool_value(text == "true");
    return;
  }

  char*        end    = nullptr;
  const double number = std::strtod(text.c_str(), &end);
  if (end != nullptr && *end == '\0') {
    out->set_number_value(number);
  } else {
    out->set_string_value(text);
  }
}

void Convert(const YAML::Node& node, Value* out) {
  if (node.IsScalar()) {
    ConvertScalar(node, out);
  } else if (node.IsMap()) {
    auto& fields = *out->mutable_struct_value()->mutable_fields();
    for (const auto& entry : node) {
      Convert(entry.second, &fields[entry.first.Scalar()]);
    }
  } else if (node.IsSequence()) {
    auto* list = out->mutable_list_value();
    for (const auto& item : node) {
      Convert(item, list->add_values());
    }
  } else if (node.IsNull()) {
    out->set_null_value(google::protobuf::NULL_VALUE);
  } else {
    throw std::runtime_error("config contains an undefined YAML node");
  }
}

[[noreturn]] void Reject(const std::string& what) {
  throw std::runtime_error("Invalid configuration: " + what);
}

} // namespace

// The document goes YAML -> google.protobuf.Value -> JSON -> RuntimeConfig
// so that field names, enums and unknown keys follow proto3 JSON rules.
artscan::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node document;
  try {
    document = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("cannot read config " + path + ": " + e.what());
  }

  Value tree;
  Convert(document, &tree);

  std::string json;
  if (auto status = google::protobuf::util::MessageToJsonString(tree, &json); !status.ok()) {
    throw std::runtime_error("cannot convert config " + path + ": " + std::string(status.message()));
  }

  google::protobuf::util::JsonParseOptions strict;
  strict.ignore_unknown_fields = false;

  artscan::runtime::config::RuntimeConfig config;
  if (auto status = google::protobuf::util::JsonStringToMessage(json, &config, strict); !status.ok()) {
    Reject(std::string(status.message()));
  }

  Validate(config);
  return config;
}

void ConfigLoader::Validate(const artscan::runtime::config::RuntimeConfig& config) {
  const auto& recognition = config.recognition();
  const auto  threshold   = recognition.distance_threshold();
  if (!std::isfinite(threshold) || threshold < 0.0 || threshold > 1.0) {
    Reject("recognition.distance_threshold must be in [0, 1]");
  }

  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    Reject("database.sqlite.path is required");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    Reject("database.postgres.connection_uri is required");
  }

  if (!config.embedding().fake() && config.embedding().endpoint().empty()) {
    Reject("embedding.endpoint is required unless embedding.fake is set");
  }
  if (!config.analysis().fake() && config.analysis().endpoint().empty()) {
    Reject("analysis.endpoint is required unless analysis.fake is set");
  }
}

} // namespace artscan::config
