#include "internal/core/retry_policy.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

namespace {

using namespace std::chrono_literals;
using negotiation::core::RetryTracker;
using negotiation::util::FromUnixMillis;

void TestDelayDoublesUpToCap() {
  RetryTracker retries(10, 100ms, 1000ms);

  assert(retries.DelayForAttempt(0) == 0ms);
  assert(retries.DelayForAttempt(1) == 100ms);
  assert(retries.DelayForAttempt(2) == 200ms);
  assert(retries.DelayForAttempt(4) == 800ms);
  assert(retries.DelayForAttempt(5) == 1000ms);
  assert(retries.DelayForAttempt(30) == 1000ms);
}

void TestFailureDefersNextAttempt() {
  RetryTracker retries(5, 100ms, 1000ms);
  const auto   now = FromUnixMillis(10'000);

  assert(retries.IsDue("n-1", now));
  assert(!retries.RecordFailure("n-1", now));
  assert(retries.Attempts("n-1") == 1);

  assert(!retries.IsDue("n-1", now + 99ms));
  assert(retries.IsDue("n-1", now + 100ms));
  // other negotiations are unaffected
  assert(retries.IsDue("n-2", now));

  assert(!retries.RecordFailure("n-1", now));
  assert(!retries.IsDue("n-1", now + 199ms));
}

void TestExhaustionResetsEntry() {
  RetryTracker retries(3, 10ms, 100ms);
  const auto   now = FromUnixMillis(0);

  assert(!retries.RecordFailure("n-1", now));
  assert(!retries.RecordFailure("n-1", now));
  assert(retries.RecordFailure("n-1", now));

  assert(retries.Attempts("n-1") == 0);
  assert(retries.IsDue("n-1", now));
}

void TestClearForgetsFailures() {
  RetryTracker retries(3, 10s, 10s);
  const auto   now = FromUnixMillis(0);

  retries.RecordFailure("n-1", now);
  assert(!retries.IsDue("n-1", now));

  retries.Clear("n-1");
  assert(retries.IsDue("n-1", now));
  assert(retries.Attempts("n-1") == 0);
}

} // namespace

int main() {
  TestDelayDoublesUpToCap();
  TestFailureDefersNextAttempt();
  TestExhaustionResetsEntry();
  TestClearForgetsFailures();

  std::cout << "negotiation_unit_retry_policy: pass\n";
  return 0;
}
