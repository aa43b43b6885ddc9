#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/query.hpp"
#include "internal/util/status.hpp"
#include "negotiation/v1.hpp"
#include "service_context.hpp"

namespace negotiation::service {

using NegotiationResult = util::StatusResult<v1::ContractNegotiation>;

/*
  Façade used by the API layer and by inbound protocol transports.

  Reads go straight to the store. Notifications are routed to the manager
  owning the negotiation's role; user actions are checked synchronously and
  then queued on the owning manager. Every call runs inside the configured
  transaction context.
*/
class NegotiationService {
 public:
  explicit NegotiationService(ServiceContext ctx);

  // ---------------------------------------------------------------------
  // Reads
  // ---------------------------------------------------------------------

  std::optional<v1::ContractNegotiation> FindById(const std::string& negotiation_id);

  // BAD_REQUEST when a filter path or operator is invalid.
  util::StatusResult<std::vector<v1::ContractNegotiation>> Query(const db::QuerySpec& spec);

  // Symbolic state name, e.g. "REQUESTED".
  std::optional<std::string> GetState(const std::string& negotiation_id);

  std::optional<v1::ContractAgreement> GetForNegotiation(const std::string& negotiation_id);

  std::optional<v1::ContractAgreement> FindAgreement(const std::string& agreement_id);

  // ---------------------------------------------------------------------
  // User actions
  // ---------------------------------------------------------------------

  NegotiationResult InitiateNegotiation(const v1::ContractRequest& request);

  // Returns the snapshot the command was queued against.
  NegotiationResult Cancel(const std::string& negotiation_id);
  NegotiationResult Decline(const std::string& negotiation_id, const std::string& reason);

  NegotiationResult CounterOffer(const std::string& negotiation_id, const v1::ContractOffer& offer);

  // ---------------------------------------------------------------------
  // Protocol notifications
  // ---------------------------------------------------------------------

  NegotiationResult NotifyConsumerRequested(const v1::ContractRequestMessage& message, const v1::ClaimToken& token);
  NegotiationResult NotifyProviderOffered(const v1::ContractOfferMessage& message, const v1::ClaimToken& token);
  NegotiationResult NotifyProviderAgreed(const v1::ContractAgreementMessage& message, const v1::ClaimToken& token);
  NegotiationResult NotifyConsumerVerified(const v1::ContractAgreementVerificationMessage& message, const v1::ClaimToken& token);
  NegotiationResult NotifyProviderFinalized(const v1::ContractNegotiationEventMessage& message, const v1::ClaimToken& token);

  // Resolved by correlation id, routed by the stored record's type.
  NegotiationResult NotifyTerminated(const v1::ContractNegotiationTerminationMessage& message, const v1::ClaimToken& token);

 private:
  ServiceContext ctx_;
};

} // namespace negotiation::service
