#include "internal/model/codec.hpp"

#include <cmath>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/yaml_proto.hpp"

namespace sharedq::model {

using sharedq::task::v1::LockRecord;
using sharedq::task::v1::TaskDescriptor;

namespace {

template <typename Message>
Message Decode(const std::string& bytes, const std::string& source) {
  if (bytes.empty()) {
    throw util::MalformedDescriptor(source + ": empty body");
  }

  Message message;
  try {
    util::ParseYaml(bytes, &message);
  } catch (const std::exception& e) {
    throw util::MalformedDescriptor(source + ": " + e.what());
  }
  return message;
}

bool IsNonFinite(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNumberValue:
      return !std::isfinite(value.number_value());
    case google::protobuf::Value::kStructValue:
      return ContainsNonFiniteNumber(value.struct_value());
    case google::protobuf::Value::kListValue:
      for (const auto& item : value.list_value().values()) {
        if (IsNonFinite(item)) return true;
      }
      return false;
    default:
      return false;
  }
}

} // namespace

bool ContainsNonFiniteNumber(const google::protobuf::Struct& document) {
  for (const auto& [key, value] : document.fields()) {
    if (IsNonFinite(value)) return true;
  }
  return false;
}

std::string EncodeTask(const TaskDescriptor& descriptor) {
  return util::ToJson(descriptor);
}

TaskDescriptor DecodeTask(const std::string& bytes, const std::string& source) {
  return Decode<TaskDescriptor>(bytes, source);
}

std::string EncodeLock(const LockRecord& record) {
  return util::ToJson(record);
}

LockRecord DecodeLock(const std::string& bytes, const std::string& source) {
  return Decode<LockRecord>(bytes, source);
}

} // namespace sharedq::model
