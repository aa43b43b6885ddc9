#pragma once

#include "internal/core/negotiation_manager.hpp"
#include "internal/core/provider_manager.hpp"

namespace negotiation::core {

class ProviderNegotiationManager final : public NegotiationManager, public ProviderManager {
 public:
  ProviderNegotiationManager(std::shared_ptr<db::NegotiationStore> store, std::shared_ptr<dispatch::RemoteMessageDispatcher> dispatcher,
                             ManagerOptions options);

  NegotiationResult ConsumerRequested(const v1::ClaimToken& token, const v1::ContractRequestMessage& message) override;
  NegotiationResult CounterOffer(const std::string& negotiation_id, const v1::ContractOffer& offer) override;
  NegotiationResult Verified(const v1::ClaimToken& token, const std::string& correlation_id) override;
  NegotiationResult Declined(const v1::ClaimToken& token, const std::string& correlation_id, const std::string& reason) override;

  void EnqueueCommand(model::NegotiationCommand command) override {
    NegotiationManager::EnqueueCommand(std::move(command));
  }
};

} // namespace negotiation::core
