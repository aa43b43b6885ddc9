#include "remote_message_dispatcher.hpp"

namespace negotiation::dispatch {

std::string_view MessageKind(const v1::RemoteMessage& message) {
  switch (message.message_case()) {
    case v1::RemoteMessage::kRequest:
      return "request";
    case v1::RemoteMessage::kOffer:
      return "offer";
    case v1::RemoteMessage::kAgreement:
      return "agreement";
    case v1::RemoteMessage::kVerification:
      return "verification";
    case v1::RemoteMessage::kEvent:
      return "event";
    case v1::RemoteMessage::kTermination:
      return "termination";
    case v1::RemoteMessage::MESSAGE_NOT_SET:
      break;
  }
  return "empty";
}

} // namespace negotiation::dispatch
