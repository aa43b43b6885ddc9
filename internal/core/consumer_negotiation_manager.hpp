#pragma once

#include "internal/core/consumer_manager.hpp"
#include "internal/core/negotiation_manager.hpp"

namespace negotiation::core {

class ConsumerNegotiationManager final : public NegotiationManager, public ConsumerManager {
 public:
  ConsumerNegotiationManager(std::shared_ptr<db::NegotiationStore> store, std::shared_ptr<dispatch::RemoteMessageDispatcher> dispatcher,
                             ManagerOptions options);

  NegotiationResult Initiate(const v1::ContractRequest& request) override;
  NegotiationResult ProviderOffered(const v1::ClaimToken& token, const std::string& correlation_id, const v1::ContractOffer& offer) override;
  NegotiationResult ProviderAgreed(const v1::ClaimToken& token, const std::string& correlation_id, const v1::ContractAgreement& agreement,
                                   const v1::Policy& policy) override;
  NegotiationResult Finalized(const v1::ClaimToken& token, const std::string& correlation_id) override;
  NegotiationResult Declined(const v1::ClaimToken& token, const std::string& correlation_id, const std::string& reason) override;

  void EnqueueCommand(model::NegotiationCommand command) override {
    NegotiationManager::EnqueueCommand(std::move(command));
  }
};

} // namespace negotiation::core
