#pragma once

#include <string>

#include "internal/model/task_state.hpp"
#include "sharedq/task/v1/task.pb.h"

namespace sharedq::model {

/*
  A descriptor as observed under one state suffix.

  `state` is the suffix the descriptor was read from, not a field of the
  body.
*/
struct Task {
  std::string                          id;
  TaskState                            state = TaskState::kPending;
  sharedq::task::v1::TaskDescriptor    descriptor;
};

} // namespace sharedq::model
