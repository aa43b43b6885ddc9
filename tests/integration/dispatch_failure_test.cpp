#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"

namespace {

using namespace std::chrono_literals;
using negotiation::config::ConfigLoader;
using negotiation::dispatch::LoopbackNetwork;
using negotiation::factory::Application;
namespace v1 = negotiation::v1;

// Retries are exhausted after two attempts, a few milliseconds apart.
Application BuildConnector(const std::string& name, const std::shared_ptr<LoopbackNetwork>& network) {
  auto config = ConfigLoader::LoadFromString("connector:\n"
                                             "  participant_id: urn:connector:" +
                                             name +
                                             "\n"
                                             "  address: loopback://" +
                                             name +
                                             "\n"
                                             "manager:\n"
                                             "  max_retries: 2\n"
                                             "  retry_base_delay_ms: 1\n"
                                             "  retry_max_delay_ms: 2\n");
  return negotiation::factory::Build(config, network);
}

std::string Initiate(Application& consumer, const std::string& address) {
  v1::ContractRequest request;
  request.set_counter_party_id("urn:connector:provider");
  request.set_counter_party_address(address);
  request.mutable_contract_offer()->set_asset_id("asset-1");
  return consumer.service->InitiateNegotiation(request).Content().id();
}

void TestUnreachableProviderEndsInError() {
  auto network  = std::make_shared<LoopbackNetwork>();
  auto consumer = BuildConnector("consumer", network);
  auto id       = Initiate(consumer, "loopback://nowhere");

  consumer.consumer_manager->RunOnce();
  assert(consumer.service->GetState(id) == std::string("REQUESTING"));

  std::this_thread::sleep_for(10ms);
  consumer.consumer_manager->RunOnce();

  auto stored = *consumer.service->FindById(id);
  assert(consumer.service->GetState(id) == std::string("ERROR"));
  assert(stored.error_detail().find("loopback://nowhere") != std::string::npos);
}

void TestProviderComingOnlineRecovers() {
  auto network  = std::make_shared<LoopbackNetwork>();
  auto consumer = BuildConnector("consumer", network);
  auto provider = BuildConnector("provider", network);
  network->Register(consumer.address, consumer.service.get());

  auto id = Initiate(consumer, provider.address);
  consumer.consumer_manager->RunOnce();
  assert(consumer.service->GetState(id) == std::string("REQUESTING"));

  network->Register(provider.address, provider.service.get());
  std::this_thread::sleep_for(10ms);
  consumer.consumer_manager->RunOnce();
  assert(consumer.service->GetState(id) == std::string("REQUESTED"));

  network->Unregister(consumer.address);
  network->Unregister(provider.address);
}

void TestProviderErrorsAfterConsumerCancelled() {
  auto network  = std::make_shared<LoopbackNetwork>();
  auto consumer = BuildConnector("consumer", network);
  auto provider = BuildConnector("provider", network);
  network->Register(consumer.address, consumer.service.get());
  network->Register(provider.address, provider.service.get());

  auto consumer_id = Initiate(consumer, provider.address);
  consumer.consumer_manager->RunOnce();
  const auto provider_id = consumer.service->FindById(consumer_id)->correlation_id();

  // cancellation is local, the provider is not told
  assert(consumer.service->Cancel(consumer_id).Succeeded());
  consumer.consumer_manager->RunOnce();
  assert(consumer.service->GetState(consumer_id) == std::string("CANCELLED"));

  // the consumer refuses the agreement until the provider gives up
  provider.provider_manager->RunOnce();
  assert(provider.service->GetState(provider_id) == std::string("AGREEING"));

  std::this_thread::sleep_for(10ms);
  provider.provider_manager->RunOnce();
  assert(provider.service->GetState(provider_id) == std::string("ERROR"));
  assert(consumer.service->GetState(consumer_id) == std::string("CANCELLED"));

  network->Unregister(consumer.address);
  network->Unregister(provider.address);
}

} // namespace

int main() {
  TestUnreachableProviderEndsInError();
  TestProviderComingOnlineRecovers();
  TestProviderErrorsAfterConsumerCancelled();

  std::cout << "negotiation_integration_dispatch_failures: pass\n";
  return 0;
}
