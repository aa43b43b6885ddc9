#include "loopback_dispatcher.hpp"

#include <exception>
#include <optional>

#include "internal/observability/logging.hpp"
#include "internal/service/negotiation_service.hpp"

namespace negotiation::dispatch {

namespace {

using NegotiationResult = util::StatusResult<v1::ContractNegotiation>;

const std::string& Destination(const v1::RemoteMessage& message) {
  static const std::string kEmpty;
  switch (message.message_case()) {
    case v1::RemoteMessage::kRequest:
      return message.request().counter_party_address();
    case v1::RemoteMessage::kOffer:
      return message.offer().counter_party_address();
    case v1::RemoteMessage::kAgreement:
      return message.agreement().counter_party_address();
    case v1::RemoteMessage::kVerification:
      return message.verification().counter_party_address();
    case v1::RemoteMessage::kEvent:
      return message.event().counter_party_address();
    case v1::RemoteMessage::kTermination:
      return message.termination().counter_party_address();
    case v1::RemoteMessage::MESSAGE_NOT_SET:
      break;
  }
  return kEmpty;
}

// Receiver refusals that may clear up once the receiver catches up.
bool IsTransient(util::FailureReason reason) {
  return reason == util::FailureReason::kNotFound || reason == util::FailureReason::kConflict ||
         reason == util::FailureReason::kTransient;
}

std::optional<NegotiationResult> Route(service::NegotiationService& receiver, const v1::RemoteMessage& message,
                                       const v1::ClaimToken& token) {
  switch (message.message_case()) {
    case v1::RemoteMessage::kRequest:
      return receiver.NotifyConsumerRequested(message.request(), token);
    case v1::RemoteMessage::kOffer:
      return receiver.NotifyProviderOffered(message.offer(), token);
    case v1::RemoteMessage::kAgreement:
      return receiver.NotifyProviderAgreed(message.agreement(), token);
    case v1::RemoteMessage::kVerification:
      return receiver.NotifyConsumerVerified(message.verification(), token);
    case v1::RemoteMessage::kEvent:
      if (message.event().type() == v1::ContractNegotiationEventMessage::TYPE_FINALIZED) {
        return receiver.NotifyProviderFinalized(message.event(), token);
      }
      return std::nullopt;
    case v1::RemoteMessage::kTermination:
      return receiver.NotifyTerminated(message.termination(), token);
    case v1::RemoteMessage::MESSAGE_NOT_SET:
      break;
  }
  return std::nullopt;
}

} // namespace

void LoopbackNetwork::Register(const std::string& address, service::NegotiationService* service) {
  std::lock_guard lock(mutex_);
  services_[address] = service;
}

void LoopbackNetwork::Unregister(const std::string& address) {
  std::lock_guard lock(mutex_);
  services_.erase(address);
}

service::NegotiationService* LoopbackNetwork::Find(const std::string& address) const {
  std::lock_guard lock(mutex_);
  auto            it = services_.find(address);
  return it == services_.end() ? nullptr : it->second;
}

LoopbackDispatcher::LoopbackDispatcher(std::shared_ptr<LoopbackNetwork> network, std::string participant_id)
    : network_(std::move(network)), participant_id_(std::move(participant_id)) {
}

DispatchResult LoopbackDispatcher::Send(const v1::RemoteMessage& message) {
  const auto& address  = Destination(message);
  auto*       receiver = network_->Find(address);
  if (receiver == nullptr) {
    return DispatchResult::Transient("no connector registered at '" + address + "'");
  }

  v1::ClaimToken token;
  (*token.mutable_claims())["client_id"] = participant_id_;

  try {
    auto result = Route(*receiver, message, token);
    if (!result) {
      return DispatchResult::Fatal("receiver does not handle " + std::string(MessageKind(message)) + " messages of this type");
    }
    if (result->Succeeded()) {
      return DispatchResult::Ok(result->Content().id());
    }

    const auto reason = std::string(util::ToString(result->Reason())) + ": " + result->Message();
    if (IsTransient(result->Reason())) {
      return DispatchResult::Transient(reason);
    }
    return DispatchResult::Fatal(reason);
  } catch (const std::exception& e) {
    NEGOTIATION_LOG_ERROR("loopback delivery threw",
                          {observability::StringField("address", address), observability::StringField("kind", MessageKind(message)),
                           observability::StringField("error", e.what())});
    return DispatchResult::Transient(e.what());
  }
}

} // namespace negotiation::dispatch
