#pragma once

#include <cstddef>
#include <string>

#include "time.hpp"

namespace sharedq::util {

/*
  Identifier helpers.

  Task ids look like task-<unix-millis>-<8 hex>. They always contain letters,
  so a YAML reader never mistakes one for a number.
*/

std::string RandomHex(std::size_t bytes);

std::string GenerateTaskId(TimePoint now);

// <hostname>-<pid>-<8 hex>
std::string GenerateWorkerId();

// Rejects ids that would escape the storage tree or collide with hidden
// temp files.
void ValidateId(const std::string& id);

} // namespace sharedq::util
