#include "consumer_negotiation_manager.hpp"

#include "internal/util/uuid.hpp"

namespace negotiation::core {

ConsumerNegotiationManager::ConsumerNegotiationManager(std::shared_ptr<db::NegotiationStore>              store,
                                                       std::shared_ptr<dispatch::RemoteMessageDispatcher> dispatcher, ManagerOptions options)
    : NegotiationManager(v1::NEGOTIATION_TYPE_CONSUMER, std::move(store), std::move(dispatcher), std::move(options)) {
}

NegotiationResult ConsumerNegotiationManager::Initiate(const v1::ContractRequest& request) {
  if (!request.has_contract_offer()) {
    return NegotiationResult::Failure(util::FailureReason::kBadRequest, "contract request carries no offer");
  }
  if (request.counter_party_address().empty()) {
    return NegotiationResult::Failure(util::FailureReason::kBadRequest, "contract request carries no counter-party address");
  }

  v1::ContractNegotiation negotiation;
  negotiation.set_id(util::GenerateId());
  negotiation.set_counter_party_id(request.counter_party_id());
  negotiation.set_counter_party_address(request.counter_party_address());
  negotiation.set_protocol(request.protocol().empty() ? Options().protocol : request.protocol());
  negotiation.set_state(model::Code(model::NegotiationState::kRequesting));

  auto* offer = negotiation.add_contract_offers();
  *offer      = request.contract_offer();
  if (offer->id().empty()) {
    offer->set_id(util::GenerateId());
  }

  return Create(std::move(negotiation));
}

NegotiationResult ConsumerNegotiationManager::ProviderOffered(const v1::ClaimToken&, const std::string& correlation_id,
                                                              const v1::ContractOffer& offer) {
  return ApplyToCorrelation(correlation_id, statemachine::OfferReceivedEvent{offer});
}

NegotiationResult ConsumerNegotiationManager::ProviderAgreed(const v1::ClaimToken&, const std::string& correlation_id,
                                                             const v1::ContractAgreement& agreement, const v1::Policy& policy) {
  if (agreement.id().empty()) {
    return NegotiationResult::Failure(util::FailureReason::kBadRequest, "contract agreement carries no id");
  }

  // NOT_FOUND until the request acknowledgement is saved; the provider retries
  return ApplyToCorrelation(correlation_id, statemachine::AgreementReceivedEvent{agreement, policy});
}

NegotiationResult ConsumerNegotiationManager::Finalized(const v1::ClaimToken&, const std::string& correlation_id) {
  return ApplyToCorrelation(correlation_id, statemachine::FinalizationReceivedEvent{});
}

NegotiationResult ConsumerNegotiationManager::Declined(const v1::ClaimToken&, const std::string& correlation_id, const std::string& reason) {
  return ApplyToCorrelation(correlation_id, statemachine::TerminationReceivedEvent{reason});
}

} // namespace negotiation::core
