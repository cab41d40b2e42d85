#pragma once

#include <cstdint>
#include <random>
#include <string_view>
#include <utility>

#include "errors.hpp"
#include "internal/observability/logging.hpp"
#include "time.hpp"

namespace sharedq::util {

/*
  Bounded exponential backoff with jitter.

  delay(attempt) = min(base * 2^attempt * (1 + U[0,1)), max)
*/
struct RetryPolicy {
  uint32_t     max_attempts = 5;
  Milliseconds base_delay{100};
  Milliseconds max_delay{5000};
};

Milliseconds BackoffDelay(const RetryPolicy& policy, uint32_t attempt);

// Runs fn, retrying only on StorageIOError. The last error is rethrown once
// max_attempts is used up. Other exceptions pass through untouched.
template <typename Fn>
auto RetryOnStorageError(const RetryPolicy& policy, Clock& clock, std::string_view what, Fn&& fn) -> decltype(fn()) {
  const uint32_t attempts = policy.max_attempts == 0 ? 1 : policy.max_attempts;
  for (uint32_t attempt = 0;; ++attempt) {
    try {
      return fn();
    } catch (const StorageIOError& e) {
      if (attempt + 1 >= attempts) throw;
      const auto delay = BackoffDelay(policy, attempt);
      SHAREDQ_LOG_WARN("storage operation failed, retrying",
                       {observability::StringField("operation", what), observability::IntField("attempt", attempt + 1),
                        observability::IntField("delay_ms", delay.count()), observability::StringField("error", e.what())});
      clock.SleepFor(delay);
    }
  }
}

} // namespace sharedq::util
