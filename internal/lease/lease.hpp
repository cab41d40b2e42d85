#pragma once

#include <optional>
#include <string>

#include "internal/util/time.hpp"
#include "sharedq/task/v1/task.pb.h"

namespace sharedq::lease {

enum class MarkerState {
  kAbsent,
  kLive,
  kStale,
};

/*
  What a reader sees when it inspects a task's lock marker.

  `record` is empty when the marker is absent or its body cannot be parsed;
  in the latter case `last_heartbeat` falls back to the file's modification
  time.
*/
struct MarkerStatus {
  MarkerState                                  state = MarkerState::kAbsent;
  std::optional<sharedq::task::v1::LockRecord> record;
  util::TimePoint                              last_heartbeat{};

  std::string owner() const {
    return record ? record->owner_id() : std::string();
  }
};

} // namespace sharedq::lease
