#pragma once

#include <string>
#include <string_view>

#include "negotiation/v1.hpp"

namespace negotiation::dispatch {

enum class DispatchStatus {
  kOk,
  // worth retrying later: counter-party unreachable or not ready
  kTransient,
  // the counter-party will never accept this message
  kFatal,
};

constexpr std::string_view ToString(DispatchStatus status) {
  switch (status) {
    case DispatchStatus::kOk:
      return "ok";
    case DispatchStatus::kTransient:
      return "transient";
    case DispatchStatus::kFatal:
      return "fatal";
  }
  return "unknown";
}

struct DispatchResult {
  DispatchStatus status = DispatchStatus::kOk;
  std::string    message;
  // receiver's negotiation id, when it acknowledged one
  std::string counter_party_process_id;

  static DispatchResult Ok(std::string counter_party_process_id = {}) {
    return {DispatchStatus::kOk, {}, std::move(counter_party_process_id)};
  }

  static DispatchResult Transient(std::string message) {
    return {DispatchStatus::kTransient, std::move(message), {}};
  }

  static DispatchResult Fatal(std::string message) {
    return {DispatchStatus::kFatal, std::move(message), {}};
  }

  bool Succeeded() const {
    return status == DispatchStatus::kOk;
  }
};

// Name of the populated oneof, e.g. "request", used in logs and metrics.
std::string_view MessageKind(const v1::RemoteMessage& message);

/*
  Outbound transport. Synchronous from the manager's point of view: Send
  returns once the counter-party accepted or refused the message.
*/
class RemoteMessageDispatcher {
 public:
  virtual ~RemoteMessageDispatcher() = default;

  virtual DispatchResult Send(const v1::RemoteMessage& message) = 0;
};

} // namespace negotiation::dispatch
