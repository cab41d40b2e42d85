#pragma once

#include <string>

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>
#include <yaml-cpp/yaml.h>

namespace sharedq::util {

/*
  YAML <-> protobuf bridge shared by the config loader and the descriptor
  codec.

  YAML is converted to a google.protobuf.Value, printed as JSON and parsed
  into the target message with protobuf's JSON parser. Plain scalars that
  look like numbers or booleans are typed; quoted scalars stay strings.
*/

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

// Throws std::runtime_error on any parse or schema error.
void ParseYaml(const std::string& text, google::protobuf::Message* message, bool ignore_unknown_fields = false);
void ParseYamlNode(const YAML::Node& node, google::protobuf::Message* message, bool ignore_unknown_fields = false);

// Parses a YAML/JSON mapping into a Struct. Throws std::runtime_error if the
// document is not a mapping.
google::protobuf::Struct ParseStruct(const std::string& text);

// JSON with whitespace and proto field names, which is also valid YAML.
std::string ToJson(const google::protobuf::Message& message);

} // namespace sharedq::util
