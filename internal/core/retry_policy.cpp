#include "retry_policy.hpp"

#include <algorithm>

namespace negotiation::core {

RetryTracker::RetryTracker(int max_retries, std::chrono::milliseconds base_delay, std::chrono::milliseconds max_delay)
    : max_retries_(max_retries), base_delay_(base_delay), max_delay_(std::max(base_delay, max_delay)) {
}

std::chrono::milliseconds RetryTracker::DelayForAttempt(int attempt) const {
  if (attempt <= 0) return std::chrono::milliseconds(0);

  auto delay = base_delay_;
  for (int i = 1; i < attempt && delay < max_delay_; ++i) {
    delay *= 2;
  }
  return std::min(delay, max_delay_);
}

bool RetryTracker::IsDue(const std::string& negotiation_id, util::TimePoint now) const {
  std::lock_guard lock(mutex_);
  auto            it = entries_.find(negotiation_id);
  return it == entries_.end() || it->second.next_attempt_at <= now;
}

bool RetryTracker::RecordFailure(const std::string& negotiation_id, util::TimePoint now) {
  std::lock_guard lock(mutex_);
  auto&           entry = entries_[negotiation_id];
  ++entry.attempts;
  if (entry.attempts >= max_retries_) {
    entries_.erase(negotiation_id);
    return true;
  }
  entry.next_attempt_at = now + DelayForAttempt(entry.attempts);
  return false;
}

void RetryTracker::Clear(const std::string& negotiation_id) {
  std::lock_guard lock(mutex_);
  entries_.erase(negotiation_id);
}

int RetryTracker::Attempts(const std::string& negotiation_id) const {
  std::lock_guard lock(mutex_);
  auto            it = entries_.find(negotiation_id);
  return it == entries_.end() ? 0 : it->second.attempts;
}

} // namespace negotiation::core
