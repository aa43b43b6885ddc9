#include "provider_negotiation_manager.hpp"

#include "internal/util/uuid.hpp"

namespace negotiation::core {

namespace {

constexpr const char* kClientIdClaim = "client_id";

bool SameOffer(const v1::ContractNegotiation& negotiation, const v1::ContractOffer& offer) {
  const auto count = negotiation.contract_offers_size();
  return count > 0 && !offer.id().empty() && negotiation.contract_offers(count - 1).id() == offer.id();
}

} // namespace

ProviderNegotiationManager::ProviderNegotiationManager(std::shared_ptr<db::NegotiationStore>              store,
                                                       std::shared_ptr<dispatch::RemoteMessageDispatcher> dispatcher, ManagerOptions options)
    : NegotiationManager(v1::NEGOTIATION_TYPE_PROVIDER, std::move(store), std::move(dispatcher), std::move(options)) {
}

NegotiationResult ProviderNegotiationManager::ConsumerRequested(const v1::ClaimToken& token, const v1::ContractRequestMessage& message) {
  if (message.process_id().empty()) {
    return NegotiationResult::Failure(util::FailureReason::kBadRequest, "contract request carries no process id");
  }
  if (!message.has_contract_offer()) {
    return NegotiationResult::Failure(util::FailureReason::kBadRequest, "contract request carries no offer");
  }

  if (auto existing = FindByCorrelation(message.process_id())) {
    // resent initial request, already recorded
    if (statemachine::StateOf(*existing) == model::NegotiationState::kConsumerRequested && SameOffer(*existing, message.contract_offer())) {
      return NegotiationResult::Success(std::move(*existing));
    }
    return Apply(*existing, statemachine::RequestReceivedEvent{message.contract_offer()});
  }

  const auto& claims           = token.claims();
  const auto  claim            = claims.find(std::string(kClientIdClaim));
  const auto  counter_party_id = claim != claims.end() && !claim->second.empty() ? claim->second : message.connector_id();
  if (counter_party_id.empty()) {
    return NegotiationResult::Failure(util::FailureReason::kBadRequest, "contract request does not identify the consumer");
  }
  if (message.callback_address().empty()) {
    return NegotiationResult::Failure(util::FailureReason::kBadRequest, "contract request carries no callback address");
  }

  v1::ContractNegotiation negotiation;
  negotiation.set_id(util::GenerateId());
  negotiation.set_correlation_id(message.process_id());
  negotiation.set_counter_party_id(counter_party_id);
  negotiation.set_counter_party_address(message.callback_address());
  negotiation.set_protocol(message.protocol().empty() ? Options().protocol : message.protocol());
  negotiation.set_state(model::Code(model::NegotiationState::kConsumerRequested));
  *negotiation.add_contract_offers() = message.contract_offer();

  return Create(std::move(negotiation));
}

NegotiationResult ProviderNegotiationManager::CounterOffer(const std::string& negotiation_id, const v1::ContractOffer& offer) {
  auto current = FindOwned(negotiation_id);
  if (!current) {
    return NegotiationResult::Failure(util::FailureReason::kNotFound, "no provider negotiation " + negotiation_id);
  }

  auto counter = offer;
  if (counter.id().empty()) {
    counter.set_id(util::GenerateId());
  }
  return Apply(*current, statemachine::CounterOfferEvent{std::move(counter)});
}

NegotiationResult ProviderNegotiationManager::Verified(const v1::ClaimToken&, const std::string& correlation_id) {
  return ApplyToCorrelation(correlation_id, statemachine::VerificationReceivedEvent{});
}

NegotiationResult ProviderNegotiationManager::Declined(const v1::ClaimToken&, const std::string& correlation_id, const std::string& reason) {
  return ApplyToCorrelation(correlation_id, statemachine::TerminationReceivedEvent{reason});
}

} // namespace negotiation::core
