#include "id.hpp"

#include <unistd.h>

#include <cstdio>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace sharedq::util {

std::string RandomHex(std::size_t bytes) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::ostringstream oss;
  for (std::size_t i = 0; i < bytes; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(static_cast<uint8_t>(rng()));
  }
  return oss.str();
}

std::string GenerateTaskId(TimePoint now) {
  return "task-" + std::to_string(ToUnixMillis(now)) + "-" + RandomHex(4);
}

std::string GenerateWorkerId() {
  char host[256] = {};
  if (::gethostname(host, sizeof(host) - 1) != 0 || host[0] == '\0') {
    std::snprintf(host, sizeof(host), "%s", "localhost");
  }
  return std::string(host) + "-" + std::to_string(::getpid()) + "-" + RandomHex(4);
}

void ValidateId(const std::string& id) {
  if (id.empty()) {
    throw std::invalid_argument("id must not be empty");
  }
  if (id.front() == '.') {
    throw std::invalid_argument("id must not start with '.'");
  }
  for (char c : id) {
    if (c == '/' || c == '\\' || c == '\0' || c == '\n') {
      throw std::invalid_argument("id contains invalid character");
    }
  }
}

} // namespace sharedq::util
