#include "transition.hpp"

#include <algorithm>
#include <initializer_list>

#include "internal/util/uuid.hpp"

namespace negotiation::statemachine {

namespace {

using model::NegotiationState;

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

bool IsConsumer(const v1::ContractNegotiation& n) {
  return n.type() == v1::NEGOTIATION_TYPE_CONSUMER;
}

bool IsProvider(const v1::ContractNegotiation& n) {
  return n.type() == v1::NEGOTIATION_TYPE_PROVIDER;
}

bool In(NegotiationState state, std::initializer_list<NegotiationState> allowed) {
  return std::find(allowed.begin(), allowed.end(), state) != allowed.end();
}

class Builder {
 public:
  Builder(const v1::ContractNegotiation& current, const Event& event, util::TimePoint now)
      : current_(current), event_(event), now_(now) {
  }

  TransitionResult Apply(NegotiationState target) {
    TransitionResult result;
    result.outcome = Outcome::kApplied;
    result.next    = current_;
    result.next.set_state(model::Code(target));
    result.next.set_state_timestamp(util::ToUnixMillis(now_));
    return result;
  }

  TransitionResult NoOp() const {
    TransitionResult result;
    result.outcome = Outcome::kNoOp;
    result.next    = current_;
    return result;
  }

  TransitionResult Reject() const {
    TransitionResult result;
    result.outcome = Outcome::kRejected;
    result.next    = current_;
    result.reason  = "cannot apply " + std::string(EventName(event_)) + " to " + TypeName() + " negotiation " + current_.id() + " in state " +
                    std::string(model::StateName(StateOf(current_)));
    return result;
  }

  const v1::ContractNegotiation& Current() const {
    return current_;
  }

  util::TimePoint Now() const {
    return now_;
  }

 private:
  std::string TypeName() const {
    return IsConsumer(current_) ? "consumer" : IsProvider(current_) ? "provider" : "untyped";
  }

  const v1::ContractNegotiation& current_;
  const Event&                   event_;
  util::TimePoint                now_;
};

// Fills the routing header every protocol message carries.
template <typename Message>
void Address(Message* message, const v1::ContractNegotiation& n) {
  message->set_protocol(n.protocol());
  message->set_counter_party_address(n.counter_party_address());
  message->set_process_id(n.id());
}

v1::RemoteMessage RequestMessage(const v1::ContractNegotiation& n, const ProcessEvent& process) {
  v1::RemoteMessage remote;
  auto*             request = remote.mutable_request();
  Address(request, n);
  request->set_connector_id(process.participant_id);
  request->set_callback_address(process.callback_address);
  if (n.contract_offers_size() > 0) {
    *request->mutable_contract_offer() = n.contract_offers(n.contract_offers_size() - 1);
  }
  return remote;
}

v1::ContractAgreement DraftAgreement(const v1::ContractNegotiation& n, const ProcessEvent& process, util::TimePoint now) {
  v1::ContractAgreement agreement;
  agreement.set_id(util::GenerateId());
  agreement.set_provider_agent_id(process.participant_id);
  agreement.set_consumer_agent_id(n.counter_party_id());
  agreement.set_contract_signing_date(util::ToUnixSeconds(now));
  if (n.contract_offers_size() > 0) {
    const auto& offer = n.contract_offers(n.contract_offers_size() - 1);
    agreement.set_asset_id(offer.asset_id());
    *agreement.mutable_policy() = offer.policy();
    agreement.set_contract_start_date(offer.contract_start());
    agreement.set_contract_end_date(offer.contract_end());
  }
  return agreement;
}

TransitionResult ProcessConsumer(Builder& b, const ProcessEvent& process) {
  const auto& n = b.Current();
  switch (StateOf(n)) {
    case NegotiationState::kRequesting: {
      auto result    = b.Apply(NegotiationState::kRequested);
      result.message = RequestMessage(n, process);
      return result;
    }
    case NegotiationState::kOffered:
      return b.Apply(NegotiationState::kAccepting);
    case NegotiationState::kAccepting: {
      auto result    = b.Apply(NegotiationState::kAccepted);
      result.message = RequestMessage(n, process);
      return result;
    }
    case NegotiationState::kAgreed:
      return b.Apply(NegotiationState::kVerifying);
    case NegotiationState::kVerifying: {
      auto result = b.Apply(NegotiationState::kVerified);
      Address(result.message.emplace().mutable_verification(), n);
      return result;
    }
    default:
      return b.Reject();
  }
}

TransitionResult ProcessProvider(Builder& b, const ProcessEvent& process) {
  const auto& n = b.Current();
  switch (StateOf(n)) {
    case NegotiationState::kConsumerRequested: {
      // drafted once so every resend carries the same agreement id
      auto result                               = b.Apply(NegotiationState::kAgreeing);
      *result.next.mutable_contract_agreement() = DraftAgreement(n, process, b.Now());
      return result;
    }
    case NegotiationState::kOffering: {
      auto  result = b.Apply(NegotiationState::kOffered);
      auto* offer  = result.message.emplace().mutable_offer();
      Address(offer, n);
      if (n.contract_offers_size() > 0) {
        *offer->mutable_contract_offer() = n.contract_offers(n.contract_offers_size() - 1);
      }
      return result;
    }
    case NegotiationState::kAgreeing: {
      auto result = b.Apply(NegotiationState::kAgreed);
      if (!n.has_contract_agreement()) {
        *result.next.mutable_contract_agreement() = DraftAgreement(n, process, b.Now());
      }

      auto* agreement = result.message.emplace().mutable_agreement();
      Address(agreement, n);
      *agreement->mutable_contract_agreement() = result.next.contract_agreement();
      *agreement->mutable_policy()             = result.next.contract_agreement().policy();
      return result;
    }
    case NegotiationState::kVerified:
      return b.Apply(NegotiationState::kFinalizing);
    case NegotiationState::kFinalizing: {
      auto  result = b.Apply(NegotiationState::kFinalized);
      auto* event  = result.message.emplace().mutable_event();
      Address(event, n);
      event->set_type(v1::ContractNegotiationEventMessage::TYPE_FINALIZED);
      return result;
    }
    default:
      return b.Reject();
  }
}

TransitionResult Process(Builder& b, const ProcessEvent& process) {
  const auto& n = b.Current();
  if (StateOf(n) == NegotiationState::kTerminating) {
    auto  result      = b.Apply(NegotiationState::kTerminated);
    auto* termination = result.message.emplace().mutable_termination();
    Address(termination, n);
    termination->set_reason(n.error_detail());
    return result;
  }
  if (IsConsumer(n)) return ProcessConsumer(b, process);
  if (IsProvider(n)) return ProcessProvider(b, process);
  return b.Reject();
}

} // namespace

std::string_view EventName(const Event& event) {
  return std::visit(Overloaded{
                        [](const ProcessEvent&) { return std::string_view("process"); },
                        [](const RequestReceivedEvent&) { return std::string_view("request-received"); },
                        [](const OfferReceivedEvent&) { return std::string_view("offer-received"); },
                        [](const CounterOfferEvent&) { return std::string_view("counter-offer"); },
                        [](const AgreementReceivedEvent&) { return std::string_view("agreement-received"); },
                        [](const VerificationReceivedEvent&) { return std::string_view("verification-received"); },
                        [](const FinalizationReceivedEvent&) { return std::string_view("finalization-received"); },
                        [](const TerminationReceivedEvent&) { return std::string_view("termination-received"); },
                        [](const CancelEvent&) { return std::string_view("cancel"); },
                        [](const DeclineEvent&) { return std::string_view("decline"); },
                        [](const FailEvent&) { return std::string_view("fail"); },
                    },
                    event);
}

model::NegotiationState StateOf(const v1::ContractNegotiation& negotiation) {
  return model::StateFromCode(negotiation.state()).value_or(NegotiationState::kError);
}

const std::vector<model::NegotiationState>& ProcessableStates(v1::NegotiationType type) {
  static const std::vector<NegotiationState> kConsumer = {
      NegotiationState::kRequesting, NegotiationState::kOffered,   NegotiationState::kAccepting,
      NegotiationState::kAgreed,     NegotiationState::kVerifying, NegotiationState::kTerminating,
  };
  static const std::vector<NegotiationState> kProvider = {
      NegotiationState::kConsumerRequested, NegotiationState::kOffering,   NegotiationState::kAgreeing,
      NegotiationState::kVerified,          NegotiationState::kFinalizing, NegotiationState::kTerminating,
  };
  static const std::vector<NegotiationState> kNone;

  switch (type) {
    case v1::NEGOTIATION_TYPE_CONSUMER:
      return kConsumer;
    case v1::NEGOTIATION_TYPE_PROVIDER:
      return kProvider;
    default:
      return kNone;
  }
}

TransitionResult Transition(const v1::ContractNegotiation& negotiation, const Event& event, util::TimePoint now) {
  Builder    b(negotiation, event, now);
  const auto state    = StateOf(negotiation);
  const bool terminal = model::IsTerminal(state);

  return std::visit(
      Overloaded{
          [&](const ProcessEvent& e) { return Process(b, e); },

          [&](const RequestReceivedEvent& e) {
            if (!IsProvider(negotiation) || state != NegotiationState::kOffered) return b.Reject();
            auto result                        = b.Apply(NegotiationState::kConsumerRequested);
            *result.next.add_contract_offers() = e.offer;
            return result;
          },

          [&](const OfferReceivedEvent& e) {
            if (!IsConsumer(negotiation) || !In(state, {NegotiationState::kRequested, NegotiationState::kAccepted})) return b.Reject();
            auto result                        = b.Apply(NegotiationState::kOffered);
            *result.next.add_contract_offers() = e.offer;
            return result;
          },

          [&](const CounterOfferEvent& e) {
            if (!IsProvider(negotiation) || state != NegotiationState::kConsumerRequested) return b.Reject();
            auto result                        = b.Apply(NegotiationState::kOffering);
            *result.next.add_contract_offers() = e.offer;
            return result;
          },

          [&](const AgreementReceivedEvent& e) {
            if (!IsConsumer(negotiation) || !In(state, {NegotiationState::kRequesting, NegotiationState::kRequested,
                                                        NegotiationState::kAccepting, NegotiationState::kAccepted})) {
              return b.Reject();
            }
            auto  result    = b.Apply(NegotiationState::kAgreed);
            auto* agreement = result.next.mutable_contract_agreement();
            *agreement      = e.agreement;
            if (!agreement->has_policy()) *agreement->mutable_policy() = e.policy;
            return result;
          },

          [&](const VerificationReceivedEvent&) {
            if (!IsProvider(negotiation) || state != NegotiationState::kAgreed) return b.Reject();
            return b.Apply(NegotiationState::kVerified);
          },

          [&](const FinalizationReceivedEvent&) {
            if (!IsConsumer(negotiation) || !In(state, {NegotiationState::kVerifying, NegotiationState::kVerified})) return b.Reject();
            return b.Apply(NegotiationState::kFinalized);
          },

          [&](const TerminationReceivedEvent& e) {
            if (state == NegotiationState::kTerminated) return b.NoOp();
            if (terminal) return b.Reject();
            auto result = b.Apply(NegotiationState::kTerminated);
            result.next.set_error_detail(e.reason);
            return result;
          },

          [&](const CancelEvent&) {
            if (!IsConsumer(negotiation) || !model::IsBeforeAgreed(state)) return b.Reject();
            return b.Apply(NegotiationState::kCancelled);
          },

          [&](const DeclineEvent& e) {
            if (terminal) return b.Reject();
            auto result = b.Apply(NegotiationState::kTerminating);
            result.next.set_error_detail(e.reason);
            return result;
          },

          [&](const FailEvent& e) {
            if (terminal) return b.Reject();
            auto result = b.Apply(NegotiationState::kError);
            result.next.set_error_detail(e.cause);
            return result;
          },
      },
      event);
}

} // namespace negotiation::statemachine
