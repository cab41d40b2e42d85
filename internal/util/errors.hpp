#pragma once

#include <stdexcept>
#include <string>

namespace sharedq::util {

/*
  Central error types.

  Storage-level preconditions (NotFound, Conflict) are raised by the storage
  adapter; the task store translates them into RaceLost where another actor
  simply got there first.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Another actor already moved or claimed the resource. Never fatal.
class RaceLost : public std::runtime_error {
 public:
  explicit RaceLost(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageIOError : public std::runtime_error {
 public:
  explicit StorageIOError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MalformedDescriptor : public std::runtime_error {
 public:
  explicit MalformedDescriptor(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CallbackError : public std::runtime_error {
 public:
  explicit CallbackError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace sharedq::util
