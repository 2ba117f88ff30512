#include "description.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace artscan::model {

std::string DescriptionToJson(const std::map<std::string, std::string>& fields) {
  google::protobuf::Struct as_struct;
  for (const auto& [key, value] : fields) {
    (*as_struct.mutable_fields())[key].set_string_value(value);
  }
  return StructToJson(as_struct);
}

std::string StructToJson(const google::protobuf::Struct& description) {
  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(description, &json);
  if (!status.ok()) {
    throw std::runtime_error("description serialization failed: " + status.ToString());
  }
  return json;
}

google::protobuf::Struct JsonToStruct(const std::string& json) {
  google::protobuf::Struct as_struct;
  if (json.empty()) {
    return as_struct;
  }

  const auto status = google::protobuf::util::JsonStringToMessage(json, &as_struct);
  if (!status.ok()) {
    throw util::InvalidArgument("description is not a JSON object: " + status.ToString());
  }
  return as_struct;
}

std::string MergeDescriptionJson(const std::string& base_json, const google::protobuf::Struct& patch) {
  auto merged = JsonToStruct(base_json);
  for (const auto& [key, value] : patch.fields()) {
    (*merged.mutable_fields())[key] = value;
  }
  return StructToJson(merged);
}

} // namespace artscan::model
