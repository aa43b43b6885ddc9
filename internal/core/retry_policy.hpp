#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/util/time.hpp"

namespace negotiation::core {

/*
  Per-negotiation retry bookkeeping for transient dispatch failures.

  Attempts live in memory only; after a restart every negotiation starts
  again with a clean slate, which at worst resends a message the
  counter-party already has.
*/
class RetryTracker {
 public:
  RetryTracker(int max_retries, std::chrono::milliseconds base_delay, std::chrono::milliseconds max_delay);

  bool IsDue(const std::string& negotiation_id, util::TimePoint now) const;

  // Records a failed attempt. Returns true when max_retries is exhausted.
  bool RecordFailure(const std::string& negotiation_id, util::TimePoint now);

  void Clear(const std::string& negotiation_id);

  int Attempts(const std::string& negotiation_id) const;

  // base_delay * 2^(attempt-1), capped at max_delay
  std::chrono::milliseconds DelayForAttempt(int attempt) const;

 private:
  struct Entry {
    int             attempts = 0;
    util::TimePoint next_attempt_at;
  };

  int                       max_retries_;
  std::chrono::milliseconds base_delay_;
  std::chrono::milliseconds max_delay_;

  mutable std::mutex                     mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

} // namespace negotiation::core
