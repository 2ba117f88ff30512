#pragma once

#include <google/protobuf/struct.pb.h>

#include <map>
#include <string>

namespace artscan::model {

/*
  Artwork descriptions are free-form JSON objects (style, year, medium,
  narrative, ...). They travel as google.protobuf.Struct on the wire and
  are stored as JSON text.
*/

std::string DescriptionToJson(const std::map<std::string, std::string>& fields);

std::string StructToJson(const google::protobuf::Struct& description);

// Throws util::InvalidArgument when json is not an object.
google::protobuf::Struct JsonToStruct(const std::string& json);

// Shallow merge: keys in patch replace keys in base.
std::string MergeDescriptionJson(const std::string& base_json, const google::protobuf::Struct& patch);

} // namespace artscan::model
