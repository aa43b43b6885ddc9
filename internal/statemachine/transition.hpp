#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "internal/model/negotiation_state.hpp"
#include "internal/util/time.hpp"
#include "negotiation/v1.hpp"

namespace negotiation::statemachine {

/*
  Pure negotiation state machine.

  Transition never touches the store or the network. It returns the next
  snapshot plus at most one outbound message; persisting the snapshot and
  sending the message is the manager's job. state_count is left alone, the
  store bumps it on save.
*/

// Loop tick. Identity of the local connector is needed to fill outbound
// requests and drafted agreements.
struct ProcessEvent {
  std::string participant_id;
  std::string callback_address;
};

struct RequestReceivedEvent {
  v1::ContractOffer offer;
};

struct OfferReceivedEvent {
  v1::ContractOffer offer;
};

struct CounterOfferEvent {
  v1::ContractOffer offer;
};

struct AgreementReceivedEvent {
  v1::ContractAgreement agreement;
  v1::Policy            policy;
};

struct VerificationReceivedEvent {};

struct FinalizationReceivedEvent {};

struct TerminationReceivedEvent {
  std::string reason;
};

struct CancelEvent {};

struct DeclineEvent {
  std::string reason;
};

struct FailEvent {
  std::string cause;
};

using Event = std::variant<ProcessEvent, RequestReceivedEvent, OfferReceivedEvent, CounterOfferEvent, AgreementReceivedEvent,
                           VerificationReceivedEvent, FinalizationReceivedEvent, TerminationReceivedEvent, CancelEvent, DeclineEvent,
                           FailEvent>;

std::string_view EventName(const Event& event);

enum class Outcome {
  kApplied,
  kNoOp,
  kRejected,
};

struct TransitionResult {
  Outcome                          outcome = Outcome::kRejected;
  v1::ContractNegotiation          next;
  std::string                      reason;
  std::optional<v1::RemoteMessage> message;

  bool Applied() const {
    return outcome == Outcome::kApplied;
  }
};

TransitionResult Transition(const v1::ContractNegotiation& negotiation, const Event& event, util::TimePoint now);

// States the role's loop has work for, in the order they are polled.
const std::vector<model::NegotiationState>& ProcessableStates(v1::NegotiationType type);

// Record state as enum; unknown codes map to ERROR.
model::NegotiationState StateOf(const v1::ContractNegotiation& negotiation);

} // namespace negotiation::statemachine
