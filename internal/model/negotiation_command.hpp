#pragma once

#include <string>
#include <type_traits>
#include <variant>

namespace negotiation::model {

/*
  Imperative actions queued by users or API callers. Transient: commands live
  in the owning manager's queue only and are lost on restart.
*/

struct CancelNegotiationCommand {
  std::string negotiation_id;
};

struct DeclineNegotiationCommand {
  std::string negotiation_id;
  std::string reason;
};

using NegotiationCommand = std::variant<CancelNegotiationCommand, DeclineNegotiationCommand>;

inline const std::string& TargetNegotiationId(const NegotiationCommand& command) {
  return std::visit([](const auto& c) -> const std::string& { return c.negotiation_id; }, command);
}

inline const char* CommandName(const NegotiationCommand& command) {
  return std::visit(
      [](const auto& c) -> const char* {
        if constexpr (std::is_same_v<std::decay_t<decltype(c)>, CancelNegotiationCommand>) {
          return "cancel";
        } else {
          return "decline";
        }
      },
      command);
}

} // namespace negotiation::model
