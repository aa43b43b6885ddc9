#pragma once

#include <chrono>
#include <cstdint>

namespace negotiation::util {

// Wall-clock helpers. Negotiation timestamps are persisted as unix millis.

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

int64_t ToUnixSeconds(TimePoint tp);

} // namespace negotiation::util
