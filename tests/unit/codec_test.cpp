#include "internal/model/codec.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

#include "internal/model/task_state.hpp"
#include "internal/util/backoff.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/id.hpp"
#include "internal/util/time.hpp"
#include "internal/util/yaml_proto.hpp"

namespace {

using namespace std::chrono_literals;

using sharedq::model::TaskState;
using sharedq::task::v1::TaskDescriptor;

void TestDescriptorSurvivesEncoding() {
  sharedq::util::ManualClock clock;

  TaskDescriptor descriptor;
  descriptor.set_id("task-1");
  descriptor.set_owner("worker-a");
  descriptor.set_retry_count(2);
  descriptor.set_priority(-4);
  *descriptor.mutable_payload()      = sharedq::util::ParseStruct(R"({"n": 5, "tags": ["a", "b"], "nested": {"flag": true}})");
  *descriptor.mutable_heartbeat_at() = sharedq::util::ToProto(clock.Now());

  const auto decoded = sharedq::model::DecodeTask(sharedq::model::EncodeTask(descriptor), "task-1.running");
  assert(decoded.id() == "task-1");
  assert(decoded.owner() == "worker-a");
  assert(decoded.retry_count() == 2);
  assert(decoded.priority() == -4);
  assert(sharedq::util::FromProto(decoded.heartbeat_at()) == clock.Now());
  assert(decoded.payload().fields().at("tags").list_value().values_size() == 2);
  assert(decoded.payload().fields().at("nested").struct_value().fields().at("flag").bool_value());
}

void TestStringsThatLookLikeNumbersStayStrings() {
  TaskDescriptor descriptor;
  descriptor.set_id("1234");
  (*descriptor.mutable_payload()->mutable_fields())["code"].set_string_value("007");
  (*descriptor.mutable_payload()->mutable_fields())["flag"].set_string_value("true");

  const auto decoded = sharedq::model::DecodeTask(sharedq::model::EncodeTask(descriptor), "1234.todo");
  assert(decoded.id() == "1234");
  assert(decoded.payload().fields().at("code").string_value() == "007");
  assert(decoded.payload().fields().at("flag").string_value() == "true");
}

void TestCamelCaseNamesAccepted() {
  const auto decoded = sharedq::model::DecodeTask(R"({"id": "t", "retryCount": 3, "failureReason": "stale task recovery"})", "t.todo");
  assert(decoded.retry_count() == 3);
  assert(decoded.failure_reason() == "stale task recovery");
}

void TestMalformedBodies() {
  for (const std::string body : {"", "[1, 2]", "unknown_field: 1", "retry_count: lots", "id: [unclosed"}) {
    bool malformed = false;
    try {
      sharedq::model::DecodeTask(body, "x.todo");
    } catch (const sharedq::util::MalformedDescriptor& e) {
      malformed = std::string(e.what()).find("x.todo") != std::string::npos;
    }
    assert(malformed);
  }
}

void TestNonFiniteNumbersDetected() {
  auto document = sharedq::util::ParseStruct(R"({"n": 5, "nested": {"list": [1, 2.5, "inf"]}})");
  assert(!sharedq::model::ContainsNonFiniteNumber(document));

  auto* list = (*document.mutable_fields())["nested"].mutable_struct_value()->mutable_fields()->at("list").mutable_list_value();
  list->add_values()->set_number_value(std::numeric_limits<double>::quiet_NaN());
  assert(sharedq::model::ContainsNonFiniteNumber(document));

  google::protobuf::Struct top;
  (*top.mutable_fields())["square"].set_number_value(-std::numeric_limits<double>::infinity());
  assert(sharedq::model::ContainsNonFiniteNumber(top));
}

void TestStateNames() {
  assert(sharedq::model::Suffix(TaskState::kPending) == "todo");
  assert(sharedq::model::StateName(TaskState::kPending) == "pending");
  assert(sharedq::model::ParseState("todo") == TaskState::kPending);
  assert(sharedq::model::ParseState("pending") == TaskState::kPending);
  assert(sharedq::model::ParseState("failed") == TaskState::kFailed);
  assert(!sharedq::model::ParseState("lock").has_value());
  assert(sharedq::model::StateFromSuffix("running") == TaskState::kRunning);

  assert(sharedq::model::CanTransition(TaskState::kPending, TaskState::kRunning));
  assert(sharedq::model::CanTransition(TaskState::kRunning, TaskState::kPending));
  assert(sharedq::model::CanTransition(TaskState::kRunning, TaskState::kFailed));
  assert(!sharedq::model::CanTransition(TaskState::kDone, TaskState::kPending));
  assert(!sharedq::model::CanTransition(TaskState::kPending, TaskState::kFailed));
}

void TestIds() {
  sharedq::util::ManualClock clock;
  const auto                 a = sharedq::util::GenerateTaskId(clock.Now());
  const auto                 b = sharedq::util::GenerateTaskId(clock.Now());
  assert(a != b);
  assert(a.rfind("task-", 0) == 0);
  sharedq::util::ValidateId(a);
  sharedq::util::ValidateId(sharedq::util::GenerateWorkerId());

  for (const std::string bad : {"", ".hidden", "a/b", "a\\b"}) {
    bool rejected = false;
    try {
      sharedq::util::ValidateId(bad);
    } catch (const std::invalid_argument&) {
      rejected = true;
    }
    assert(rejected);
  }
}

void TestBackoffIsBoundedAndGrows() {
  sharedq::util::RetryPolicy policy;
  policy.base_delay = 100ms;
  policy.max_delay  = 1000ms;

  for (int i = 0; i < 20; ++i) {
    const auto first = sharedq::util::BackoffDelay(policy, 0);
    assert(first >= 100ms && first < 200ms);
    const auto third = sharedq::util::BackoffDelay(policy, 2);
    assert(third >= 400ms && third < 800ms);
    assert(sharedq::util::BackoffDelay(policy, 10) == 1000ms);
  }
}

void TestRetryOnStorageError() {
  sharedq::util::ManualClock clock;
  const auto                 start = clock.Now();

  sharedq::util::RetryPolicy policy;
  policy.max_attempts = 3;

  int  calls  = 0;
  auto result = sharedq::util::RetryOnStorageError(policy, clock, "flaky", [&] {
    if (++calls < 3) throw sharedq::util::StorageIOError("transient");
    return 42;
  });
  assert(result == 42);
  assert(calls == 3);
  assert(clock.Now() > start);

  calls         = 0;
  bool gave_up  = false;
  try {
    sharedq::util::RetryOnStorageError(policy, clock, "broken", [&] {
      ++calls;
      throw sharedq::util::StorageIOError("still broken");
    });
  } catch (const sharedq::util::StorageIOError&) {
    gave_up = true;
  }
  assert(gave_up && calls == 3);

  // other errors are not retried
  calls          = 0;
  bool race_lost = false;
  try {
    sharedq::util::RetryOnStorageError(policy, clock, "race", [&] {
      ++calls;
      throw sharedq::util::RaceLost("moved");
    });
  } catch (const sharedq::util::RaceLost&) {
    race_lost = true;
  }
  assert(race_lost && calls == 1);
}

} // namespace

int main() {
  TestDescriptorSurvivesEncoding();
  TestStringsThatLookLikeNumbersStayStrings();
  TestCamelCaseNamesAccepted();
  TestMalformedBodies();
  TestNonFiniteNumbersDetected();
  TestStateNames();
  TestIds();
  TestBackoffIsBoundedAndGrows();
  TestRetryOnStorageError();

  std::cout << "sharedq_unit_codec: pass\n";
  return 0;
}
