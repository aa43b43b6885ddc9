#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/core/consumer_negotiation_manager.hpp"
#include "internal/core/provider_negotiation_manager.hpp"
#include "internal/db/api/negotiation_store.hpp"
#include "internal/dispatch/loopback_dispatcher.hpp"
#include "internal/service/negotiation_service.hpp"

namespace negotiation::factory {

/*
  Application

  Everything one connector needs, owned for the lifetime of the process.
*/
struct Application {
  std::string participant_id;
  std::string address;

  std::shared_ptr<db::NegotiationStore>             store;
  std::shared_ptr<dispatch::LoopbackNetwork>        network;
  std::shared_ptr<core::ConsumerNegotiationManager> consumer_manager;
  std::shared_ptr<core::ProviderNegotiationManager> provider_manager;
  std::shared_ptr<service::NegotiationService>      service;
};

core::ManagerOptions BuildManagerOptions(const negotiation::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root. The only place that knows concrete store and dispatcher
  types. Connectors sharing `network` can reach each other in-process; a new
  network is created when none is given. Managers are built stopped.
*/
Application Build(const negotiation::runtime::config::RuntimeConfig& config, std::shared_ptr<dispatch::LoopbackNetwork> network = nullptr);

} // namespace negotiation::factory
