#include "time.hpp"

#include <thread>

namespace sharedq::util {

TimePoint RealClock::Now() const {
  return SystemClock::now();
}

void RealClock::SleepFor(Milliseconds duration) {
  if (duration.count() > 0) std::this_thread::sleep_for(duration);
}

ManualClock::ManualClock(TimePoint start) : now_(start) {
}

TimePoint ManualClock::Now() const {
  std::lock_guard lock(mutex_);
  return now_;
}

void ManualClock::SleepFor(Milliseconds duration) {
  Advance(duration);
}

void ManualClock::Advance(Milliseconds duration) {
  std::lock_guard lock(mutex_);
  now_ += duration;
}

void ManualClock::Set(TimePoint now) {
  std::lock_guard lock(mutex_);
  now_ = now;
}

std::shared_ptr<Clock> DefaultClock() {
  static const auto clock = std::make_shared<RealClock>();
  return clock;
}

TimePoint Now() {
  return SystemClock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<SystemClock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

Milliseconds FromProto(const google::protobuf::Duration& duration) {
  return std::chrono::duration_cast<Milliseconds>(std::chrono::seconds(duration.seconds()) + std::chrono::nanoseconds(duration.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

double SecondsBetween(TimePoint from, TimePoint to) {
  return std::chrono::duration<double>(to - from).count();
}

} // namespace sharedq::util
