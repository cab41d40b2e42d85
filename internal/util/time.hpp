#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace sharedq::util {

/*
  Time utilities. Single place to control the clock source.

  Components take a Clock so tests can drive leases, heartbeats and polling
  with a ManualClock instead of sleeping.
*/

using SystemClock  = std::chrono::system_clock;
using TimePoint    = SystemClock::time_point;
using Milliseconds = std::chrono::milliseconds;

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;
  virtual void      SleepFor(Milliseconds duration) = 0;
};

class RealClock final : public Clock {
 public:
  TimePoint Now() const override;
  void      SleepFor(Milliseconds duration) override;
};

/*
  Clock that only moves when told to. SleepFor advances time instantly.
*/
class ManualClock final : public Clock {
 public:
  explicit ManualClock(TimePoint start = TimePoint{} + std::chrono::hours(24 * 365 * 50));

  TimePoint Now() const override;
  void      SleepFor(Milliseconds duration) override;

  void Advance(Milliseconds duration);
  void Set(TimePoint now);

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

std::shared_ptr<Clock> DefaultClock();

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

Milliseconds FromProto(const google::protobuf::Duration& duration);

uint64_t ToUnixMillis(TimePoint tp);

double SecondsBetween(TimePoint from, TimePoint to);

} // namespace sharedq::util
