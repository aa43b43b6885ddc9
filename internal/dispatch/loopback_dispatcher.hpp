#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/dispatch/remote_message_dispatcher.hpp"

namespace negotiation::service {
class NegotiationService;
}

namespace negotiation::dispatch {

/*
  Address book of in-process connectors. Services are not owned; whoever
  registers a service must unregister it before destroying it.
*/
class LoopbackNetwork {
 public:
  void Register(const std::string& address, service::NegotiationService* service);
  void Unregister(const std::string& address);

  service::NegotiationService* Find(const std::string& address) const;

 private:
  mutable std::mutex                                            mutex_;
  std::unordered_map<std::string, service::NegotiationService*> services_;
};

/*
  Delivers protocol messages straight into the receiving connector's service.
  The sender is presented to the receiver through a claim token carrying its
  participant id as client_id.
*/
class LoopbackDispatcher final : public RemoteMessageDispatcher {
 public:
  LoopbackDispatcher(std::shared_ptr<LoopbackNetwork> network, std::string participant_id);

  DispatchResult Send(const v1::RemoteMessage& message) override;

 private:
  std::shared_ptr<LoopbackNetwork> network_;
  std::string                      participant_id_;
};

} // namespace negotiation::dispatch
