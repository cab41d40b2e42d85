#include "backoff.hpp"

#include <algorithm>

namespace sharedq::util {

Milliseconds BackoffDelay(const RetryPolicy& policy, uint32_t attempt) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_real_distribution<double> jitter(0.0, 1.0);

  const double base   = static_cast<double>(policy.base_delay.count());
  const double factor = static_cast<double>(uint64_t{1} << std::min<uint32_t>(attempt, 30));
  const double delay  = base * factor * (1.0 + jitter(rng));
  const double cap    = static_cast<double>(policy.max_delay.count());

  return Milliseconds(static_cast<int64_t>(std::min(delay, cap)));
}

} // namespace sharedq::util
