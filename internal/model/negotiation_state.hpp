#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace negotiation::model {

/*
  Negotiation states.

  Codes are persisted and roughly follow the progress of each branch, so
  "before AGREED" can be decided by comparing codes. ERROR is negative and
  therefore must be excluded through IsTerminal first.
*/
enum class NegotiationState : std::int32_t {
  kInitial           = 50,
  kRequesting        = 100,
  kRequested         = 200,
  kConsumerRequested = 250,
  kOffering          = 300,
  kOffered           = 400,
  kAccepting         = 700,
  kAccepted          = 800,
  kAgreeing          = 825,
  kAgreed            = 850,
  kVerifying         = 1050,
  kVerified          = 1100,
  kFinalizing        = 1150,
  kFinalized         = 1200,
  kTerminating       = 1300,
  kTerminated        = 1400,
  kCancelled         = 1500,
  kError             = -1,
};

constexpr std::int32_t Code(NegotiationState state) {
  return static_cast<std::int32_t>(state);
}

constexpr bool IsTerminal(NegotiationState state) {
  return state == NegotiationState::kFinalized || state == NegotiationState::kTerminated || state == NegotiationState::kCancelled ||
         state == NegotiationState::kError;
}

// Cancellation is only allowed while no agreement exists.
constexpr bool IsBeforeAgreed(NegotiationState state) {
  return !IsTerminal(state) && Code(state) < Code(NegotiationState::kAgreed);
}

constexpr std::string_view StateName(NegotiationState state) {
  switch (state) {
    case NegotiationState::kInitial:
      return "INITIAL";
    case NegotiationState::kRequesting:
      return "REQUESTING";
    case NegotiationState::kRequested:
      return "REQUESTED";
    case NegotiationState::kConsumerRequested:
      return "CONSUMER_REQUESTED";
    case NegotiationState::kOffering:
      return "OFFERING";
    case NegotiationState::kOffered:
      return "OFFERED";
    case NegotiationState::kAccepting:
      return "ACCEPTING";
    case NegotiationState::kAccepted:
      return "ACCEPTED";
    case NegotiationState::kAgreeing:
      return "AGREEING";
    case NegotiationState::kAgreed:
      return "AGREED";
    case NegotiationState::kVerifying:
      return "VERIFYING";
    case NegotiationState::kVerified:
      return "VERIFIED";
    case NegotiationState::kFinalizing:
      return "FINALIZING";
    case NegotiationState::kFinalized:
      return "FINALIZED";
    case NegotiationState::kTerminating:
      return "TERMINATING";
    case NegotiationState::kTerminated:
      return "TERMINATED";
    case NegotiationState::kCancelled:
      return "CANCELLED";
    case NegotiationState::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

constexpr std::optional<NegotiationState> StateFromCode(std::int32_t code) {
  switch (code) {
    case Code(NegotiationState::kInitial):
    case Code(NegotiationState::kRequesting):
    case Code(NegotiationState::kRequested):
    case Code(NegotiationState::kConsumerRequested):
    case Code(NegotiationState::kOffering):
    case Code(NegotiationState::kOffered):
    case Code(NegotiationState::kAccepting):
    case Code(NegotiationState::kAccepted):
    case Code(NegotiationState::kAgreeing):
    case Code(NegotiationState::kAgreed):
    case Code(NegotiationState::kVerifying):
    case Code(NegotiationState::kVerified):
    case Code(NegotiationState::kFinalizing):
    case Code(NegotiationState::kFinalized):
    case Code(NegotiationState::kTerminating):
    case Code(NegotiationState::kTerminated):
    case Code(NegotiationState::kCancelled):
    case Code(NegotiationState::kError):
      return static_cast<NegotiationState>(code);
    default:
      return std::nullopt;
  }
}

} // namespace negotiation::model
