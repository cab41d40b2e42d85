#pragma once

#include <string>

#include <google/protobuf/struct.pb.h>

#include "sharedq/task/v1/task.pb.h"

namespace sharedq::model {

/*
  Descriptor and lock marker bodies.

  Written as JSON, read as YAML so descriptors may also be hand-authored in
  YAML by producers. Decode errors raise util::MalformedDescriptor; `source`
  only names the file in the message.
*/

std::string                       EncodeTask(const sharedq::task::v1::TaskDescriptor& descriptor);
sharedq::task::v1::TaskDescriptor DecodeTask(const std::string& bytes, const std::string& source);

std::string                   EncodeLock(const sharedq::task::v1::LockRecord& record);
sharedq::task::v1::LockRecord DecodeLock(const std::string& bytes, const std::string& source);

// JSON has no NaN or Infinity; protobuf prints them as strings, which read
// back as strings. Payloads and results carrying them are rejected.
bool ContainsNonFiniteNumber(const google::protobuf::Struct& document);

} // namespace sharedq::model
