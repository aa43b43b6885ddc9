#pragma once

#include <string>

#include "internal/core/manager_types.hpp"
#include "internal/model/negotiation_command.hpp"

namespace negotiation::core {

/*
  Provider side of the negotiation, as seen by the service façade.
*/
class ProviderManager {
 public:
  virtual ~ProviderManager() = default;

  // Creates the provider record, or continues it when the consumer accepts
  // a counter-offer (process_id already correlated).
  virtual NegotiationResult ConsumerRequested(const v1::ClaimToken& token, const v1::ContractRequestMessage& message) = 0;

  virtual NegotiationResult CounterOffer(const std::string& negotiation_id, const v1::ContractOffer& offer) = 0;

  virtual NegotiationResult Verified(const v1::ClaimToken& token, const std::string& correlation_id) = 0;

  virtual NegotiationResult Declined(const v1::ClaimToken& token, const std::string& correlation_id, const std::string& reason) = 0;

  virtual void EnqueueCommand(model::NegotiationCommand command) = 0;
};

} // namespace negotiation::core
