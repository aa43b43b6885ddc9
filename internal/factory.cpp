#include "factory.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/db/api/transaction_context.hpp"
#include "internal/db/memory/memory_negotiation_store.hpp"
#include "internal/service/service_context.hpp"

namespace negotiation::factory {

namespace {

std::shared_ptr<db::NegotiationStore> BuildStore(const negotiation::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_memory()) {
    return std::make_shared<db::memory::MemoryNegotiationStore>(std::chrono::milliseconds(config.manager().lease_duration_ms()));
  }
  throw std::runtime_error("no supported database backend configured");
}

} // namespace

core::ManagerOptions BuildManagerOptions(const negotiation::runtime::config::RuntimeConfig& config) {
  const auto& manager   = config.manager();
  const auto& connector = config.connector();

  core::ManagerOptions options;
  options.participant_id       = connector.participant_id();
  options.callback_address     = connector.address();
  options.protocol             = connector.protocol();
  options.batch_size           = manager.batch_size();
  options.command_batch_size   = manager.command_batch_size();
  options.command_max_attempts = static_cast<int>(manager.command_max_attempts());
  options.workers              = manager.workers();
  options.poll_interval        = std::chrono::milliseconds(manager.poll_interval_ms());
  options.max_retries          = static_cast<int>(manager.max_retries());
  options.retry_base_delay     = std::chrono::milliseconds(manager.retry_base_delay_ms());
  options.retry_max_delay      = std::chrono::milliseconds(manager.retry_max_delay_ms());
  return options;
}

Application Build(const negotiation::runtime::config::RuntimeConfig& config, std::shared_ptr<dispatch::LoopbackNetwork> network) {
  Application app;
  app.participant_id = config.connector().participant_id();
  app.address        = config.connector().address();

  // ------------------------------------------------------------------
  // Store and transport
  // ------------------------------------------------------------------
  app.store   = BuildStore(config);
  app.network = network ? std::move(network) : std::make_shared<dispatch::LoopbackNetwork>();

  auto dispatcher = std::make_shared<dispatch::LoopbackDispatcher>(app.network, app.participant_id);

  // ------------------------------------------------------------------
  // Managers
  // ------------------------------------------------------------------
  const auto options   = BuildManagerOptions(config);
  app.consumer_manager = std::make_shared<core::ConsumerNegotiationManager>(app.store, dispatcher, options);
  app.provider_manager = std::make_shared<core::ProviderNegotiationManager>(app.store, dispatcher, options);

  // ------------------------------------------------------------------
  // Service
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store            = app.store;
  ctx.consumer_manager = app.consumer_manager;
  ctx.provider_manager = app.provider_manager;
  ctx.transactions     = std::make_shared<db::NoopTransactionContext>();

  app.service = std::make_shared<service::NegotiationService>(std::move(ctx));
  return app;
}

} // namespace negotiation::factory
