#include "negotiation_service.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "internal/core/consumer_manager.hpp"
#include "internal/core/provider_manager.hpp"
#include "internal/db/api/negotiation_store.hpp"
#include "internal/db/api/transaction_context.hpp"
#include "internal/model/negotiation_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/query/field_path.hpp"
#include "internal/statemachine/transition.hpp"

namespace negotiation::service {

namespace {

using observability::StringField;

template <typename T>
bool Succeeded(const util::StatusResult<T>& result) {
  return result.Succeeded();
}

template <typename T>
bool Succeeded(const std::optional<T>&) {
  return true;
}

template <typename Fn>
auto Observe(db::TransactionContext& transactions, std::string_view route, std::string_view negotiation_id, Fn&& fn) {
  observability::SpanScope span(route);
  if (!negotiation_id.empty()) {
    span.SetAttribute("negotiation.id", negotiation_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       record     = [&](bool success) {
    observability::Metrics::Instance().RecordRequest(route, success);
    observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    auto result = transactions.Run(std::forward<Fn>(fn));
    record(Succeeded(result));
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    NEGOTIATION_LOG_ERROR("request failed",
                          {StringField("route", route), StringField("negotiation_id", negotiation_id), StringField("error", ex.what())});
    record(false);
    throw;
  }
}

NegotiationResult NotFound(const std::string& negotiation_id) {
  return NegotiationResult::Failure(util::FailureReason::kNotFound, "negotiation " + negotiation_id + " not found");
}

} // namespace

NegotiationService::NegotiationService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.store || !ctx_.consumer_manager || !ctx_.provider_manager) {
    throw std::invalid_argument("negotiation service requires a store and both managers");
  }
  if (!ctx_.transactions) {
    ctx_.transactions = std::make_shared<db::NoopTransactionContext>();
  }
}

// ---------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------

std::optional<v1::ContractNegotiation> NegotiationService::FindById(const std::string& negotiation_id) {
  return Observe(*ctx_.transactions, "FindById", negotiation_id, [&] { return ctx_.store->FindById(negotiation_id); });
}

util::StatusResult<std::vector<v1::ContractNegotiation>> NegotiationService::Query(const db::QuerySpec& spec) {
  using QueryResult = util::StatusResult<std::vector<v1::ContractNegotiation>>;

  return Observe(*ctx_.transactions, "Query", {}, [&]() -> QueryResult {
    for (const auto& criterion : spec.filter) {
      if (!query::IsSupportedOperator(criterion.op)) {
        return QueryResult::Failure(util::FailureReason::kBadRequest, "unsupported filter operator '" + criterion.op + "'");
      }
      if (auto error = query::ValidatePath(v1::ContractNegotiation::descriptor(), criterion.operand_left)) {
        return QueryResult::Failure(util::FailureReason::kBadRequest, *error);
      }
    }
    return QueryResult::Success(ctx_.store->Query(spec));
  });
}

std::optional<std::string> NegotiationService::GetState(const std::string& negotiation_id) {
  return Observe(*ctx_.transactions, "GetState", negotiation_id, [&]() -> std::optional<std::string> {
    auto negotiation = ctx_.store->FindById(negotiation_id);
    if (!negotiation) {
      return std::nullopt;
    }
    return std::string(model::StateName(statemachine::StateOf(*negotiation)));
  });
}

std::optional<v1::ContractAgreement> NegotiationService::GetForNegotiation(const std::string& negotiation_id) {
  return Observe(*ctx_.transactions, "GetForNegotiation", negotiation_id, [&]() -> std::optional<v1::ContractAgreement> {
    auto negotiation = ctx_.store->FindById(negotiation_id);
    if (!negotiation || !negotiation->has_contract_agreement()) {
      return std::nullopt;
    }
    return negotiation->contract_agreement();
  });
}

std::optional<v1::ContractAgreement> NegotiationService::FindAgreement(const std::string& agreement_id) {
  return Observe(*ctx_.transactions, "FindAgreement", {}, [&] { return ctx_.store->FindContractAgreement(agreement_id); });
}

// ---------------------------------------------------------------------
// User actions
// ---------------------------------------------------------------------

NegotiationResult NegotiationService::InitiateNegotiation(const v1::ContractRequest& request) {
  return Observe(*ctx_.transactions, "InitiateNegotiation", {}, [&] { return ctx_.consumer_manager->Initiate(request); });
}

NegotiationResult NegotiationService::Cancel(const std::string& negotiation_id) {
  return Observe(*ctx_.transactions, "Cancel", negotiation_id, [&]() -> NegotiationResult {
    auto negotiation = ctx_.store->FindById(negotiation_id);
    if (!negotiation) {
      return NotFound(negotiation_id);
    }

    const auto state = statemachine::StateOf(*negotiation);
    if (negotiation->type() != v1::NEGOTIATION_TYPE_CONSUMER) {
      return NegotiationResult::Failure(util::FailureReason::kConflict, "only consumer negotiations can be cancelled");
    }
    if (!model::IsBeforeAgreed(state)) {
      return NegotiationResult::Failure(util::FailureReason::kConflict,
                                        "negotiation " + negotiation_id + " cannot be cancelled in state " + std::string(model::StateName(state)));
    }

    ctx_.consumer_manager->EnqueueCommand(model::CancelNegotiationCommand{negotiation_id});
    return NegotiationResult::Success(std::move(*negotiation));
  });
}

NegotiationResult NegotiationService::Decline(const std::string& negotiation_id, const std::string& reason) {
  return Observe(*ctx_.transactions, "Decline", negotiation_id, [&]() -> NegotiationResult {
    auto negotiation = ctx_.store->FindById(negotiation_id);
    if (!negotiation) {
      return NotFound(negotiation_id);
    }

    model::DeclineNegotiationCommand command{negotiation_id, reason};
    if (negotiation->type() == v1::NEGOTIATION_TYPE_PROVIDER) {
      ctx_.provider_manager->EnqueueCommand(std::move(command));
    } else {
      ctx_.consumer_manager->EnqueueCommand(std::move(command));
    }
    return NegotiationResult::Success(std::move(*negotiation));
  });
}

NegotiationResult NegotiationService::CounterOffer(const std::string& negotiation_id, const v1::ContractOffer& offer) {
  return Observe(*ctx_.transactions, "CounterOffer", negotiation_id,
                 [&] { return ctx_.provider_manager->CounterOffer(negotiation_id, offer); });
}

// ---------------------------------------------------------------------
// Protocol notifications
// ---------------------------------------------------------------------

NegotiationResult NegotiationService::NotifyConsumerRequested(const v1::ContractRequestMessage& message, const v1::ClaimToken& token) {
  return Observe(*ctx_.transactions, "NotifyConsumerRequested", message.process_id(),
                 [&] { return ctx_.provider_manager->ConsumerRequested(token, message); });
}

NegotiationResult NegotiationService::NotifyProviderOffered(const v1::ContractOfferMessage& message, const v1::ClaimToken& token) {
  return Observe(*ctx_.transactions, "NotifyProviderOffered", message.process_id(),
                 [&] { return ctx_.consumer_manager->ProviderOffered(token, message.process_id(), message.contract_offer()); });
}

NegotiationResult NegotiationService::NotifyProviderAgreed(const v1::ContractAgreementMessage& message, const v1::ClaimToken& token) {
  return Observe(*ctx_.transactions, "NotifyProviderAgreed", message.process_id(), [&] {
    return ctx_.consumer_manager->ProviderAgreed(token, message.process_id(), message.contract_agreement(), message.policy());
  });
}

NegotiationResult NegotiationService::NotifyConsumerVerified(const v1::ContractAgreementVerificationMessage& message,
                                                             const v1::ClaimToken&                          token) {
  return Observe(*ctx_.transactions, "NotifyConsumerVerified", message.process_id(),
                 [&] { return ctx_.provider_manager->Verified(token, message.process_id()); });
}

NegotiationResult NegotiationService::NotifyProviderFinalized(const v1::ContractNegotiationEventMessage& message, const v1::ClaimToken& token) {
  return Observe(*ctx_.transactions, "NotifyProviderFinalized", message.process_id(),
                 [&] { return ctx_.consumer_manager->Finalized(token, message.process_id()); });
}

NegotiationResult NegotiationService::NotifyTerminated(const v1::ContractNegotiationTerminationMessage& message, const v1::ClaimToken& token) {
  return Observe(*ctx_.transactions, "NotifyTerminated", message.process_id(), [&]() -> NegotiationResult {
    auto negotiation = ctx_.store->FindForCorrelationId(message.process_id());
    if (!negotiation) {
      return NegotiationResult::Failure(util::FailureReason::kNotFound, "no negotiation correlated with " + message.process_id());
    }

    switch (negotiation->type()) {
      case v1::NEGOTIATION_TYPE_CONSUMER:
        return ctx_.consumer_manager->Declined(token, message.process_id(), message.reason());
      case v1::NEGOTIATION_TYPE_PROVIDER:
        return ctx_.provider_manager->Declined(token, message.process_id(), message.reason());
      default:
        return NegotiationResult::Failure(util::FailureReason::kFatal, "negotiation " + negotiation->id() + " has no type");
    }
  });
}

} // namespace negotiation::service
