#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace sharedq::model {

/*
  Task lifecycle. The state is encoded only by the descriptor's file-name
  suffix:

      PENDING  <id>.todo
      RUNNING  <id>.running
      DONE     <id>.done
      FAILED   <id>.failed
*/
enum class TaskState : std::uint8_t {
  kPending = 0,
  kRunning = 1,
  kDone    = 2,
  kFailed  = 3,
};

inline constexpr std::array<TaskState, 4> kAllTaskStates = {TaskState::kPending, TaskState::kRunning, TaskState::kDone, TaskState::kFailed};

constexpr bool IsTerminal(TaskState state) {
  return state == TaskState::kDone || state == TaskState::kFailed;
}

constexpr bool CanTransition(TaskState from, TaskState to) {
  switch (from) {
    case TaskState::kPending:
      return to == TaskState::kRunning;
    case TaskState::kRunning:
      return to == TaskState::kPending || IsTerminal(to);
    default:
      return false;
  }
}

// Used to pick the surviving copy when a descriptor is duplicated.
constexpr int Precedence(TaskState state) {
  switch (state) {
    case TaskState::kPending:
      return 0;
    case TaskState::kRunning:
      return 1;
    default:
      return 2;
  }
}

constexpr std::string_view Suffix(TaskState state) {
  switch (state) {
    case TaskState::kPending:
      return "todo";
    case TaskState::kRunning:
      return "running";
    case TaskState::kDone:
      return "done";
    case TaskState::kFailed:
      return "failed";
  }
  return "";
}

constexpr std::string_view StateName(TaskState state) {
  switch (state) {
    case TaskState::kPending:
      return "pending";
    case TaskState::kRunning:
      return "running";
    case TaskState::kDone:
      return "done";
    case TaskState::kFailed:
      return "failed";
  }
  return "";
}

inline std::optional<TaskState> StateFromSuffix(std::string_view suffix) {
  for (auto state : kAllTaskStates) {
    if (Suffix(state) == suffix) return state;
  }
  return std::nullopt;
}

// Accepts either the suffix ("todo") or the state name ("pending").
inline std::optional<TaskState> ParseState(std::string_view text) {
  for (auto state : kAllTaskStates) {
    if (Suffix(state) == text || StateName(state) == text) return state;
  }
  return std::nullopt;
}

} // namespace sharedq::model
