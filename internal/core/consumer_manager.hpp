#pragma once

#include <string>

#include "internal/core/manager_types.hpp"
#include "internal/model/negotiation_command.hpp"

namespace negotiation::core {

/*
  Consumer side of the negotiation, as seen by the service façade.

  correlation_id arguments are the provider's process id taken from the
  inbound message.
*/
class ConsumerManager {
 public:
  virtual ~ConsumerManager() = default;

  virtual NegotiationResult Initiate(const v1::ContractRequest& request) = 0;

  virtual NegotiationResult ProviderOffered(const v1::ClaimToken& token, const std::string& correlation_id, const v1::ContractOffer& offer) = 0;

  virtual NegotiationResult ProviderAgreed(const v1::ClaimToken& token, const std::string& correlation_id,
                                           const v1::ContractAgreement& agreement, const v1::Policy& policy) = 0;

  virtual NegotiationResult Finalized(const v1::ClaimToken& token, const std::string& correlation_id) = 0;

  virtual NegotiationResult Declined(const v1::ClaimToken& token, const std::string& correlation_id, const std::string& reason) = 0;

  virtual void EnqueueCommand(model::NegotiationCommand command) = 0;
};

} // namespace negotiation::core
