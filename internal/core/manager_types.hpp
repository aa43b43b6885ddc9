#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

#include "internal/util/status.hpp"
#include "internal/util/time.hpp"
#include "negotiation/v1.hpp"

namespace negotiation::core {

using NegotiationResult = util::StatusResult<v1::ContractNegotiation>;

struct ManagerOptions {
  // identity of the local connector
  std::string participant_id;
  std::string callback_address;
  std::string protocol = "dataspace-protocol-http";

  std::size_t batch_size           = 5;
  std::size_t command_batch_size   = 5;
  int         command_max_attempts = 3;
  std::size_t workers              = 1;

  std::chrono::milliseconds poll_interval{1000};

  int                       max_retries = 7;
  std::chrono::milliseconds retry_base_delay{1000};
  std::chrono::milliseconds retry_max_delay{60000};

  std::function<util::TimePoint()> clock = util::Now;
};

} // namespace negotiation::core
