#pragma once

#include <memory>

namespace negotiation::core {
class ConsumerManager;
class ProviderManager;
} // namespace negotiation::core
namespace negotiation::db {
class NegotiationStore;
class TransactionContext;
} // namespace negotiation::db

namespace negotiation::service {

/*
  Dependencies of the negotiation service. transactions may be left empty,
  the service then runs without a transaction boundary.
*/
struct ServiceContext {
  std::shared_ptr<negotiation::db::NegotiationStore>   store;
  std::shared_ptr<negotiation::core::ConsumerManager>  consumer_manager;
  std::shared_ptr<negotiation::core::ProviderManager>  provider_manager;
  std::shared_ptr<negotiation::db::TransactionContext> transactions;
};

} // namespace negotiation::service
