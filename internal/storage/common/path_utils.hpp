#pragma once

#include <array>
#include <filesystem>
#include <string>
#include <string_view>

#include "internal/util/id.hpp"

namespace sharedq::storage::common {

inline constexpr std::array<std::string_view, 4> kTempSuffixes = {".tmp", ".reserved", ".completing", ".recovering"};

inline bool EndsWith(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline bool IsHidden(std::string_view name) {
  return !name.empty() && name.front() == '.';
}

inline bool IsTempName(std::string_view name) {
  if (!IsHidden(name)) return false;
  for (auto suffix : kTempSuffixes) {
    if (EndsWith(name, suffix)) return true;
  }
  return false;
}

// .<name>.<8 hex>.tmp beside the target
inline std::filesystem::path TempPathFor(const std::filesystem::path& target) {
  return target.parent_path() / ("." + target.filename().string() + "." + util::RandomHex(4) + ".tmp");
}

} // namespace sharedq::storage::common
