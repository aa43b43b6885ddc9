#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <google/protobuf/util/message_differencer.h>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/negotiation_state.hpp"
#include "internal/runtime/connector.hpp"

namespace {

using namespace std::chrono_literals;
using negotiation::config::ConfigLoader;
using negotiation::dispatch::LoopbackNetwork;
using negotiation::factory::Application;
using negotiation::model::Code;
using negotiation::model::NegotiationState;
using negotiation::runtime::Connector;
using google::protobuf::util::MessageDifferencer;
namespace v1 = negotiation::v1;

Application BuildConnector(const std::string& name, const std::shared_ptr<LoopbackNetwork>& network) {
  auto config = ConfigLoader::LoadFromString("connector:\n"
                                             "  participant_id: urn:connector:" +
                                             name +
                                             "\n"
                                             "  address: loopback://" +
                                             name +
                                             "\n"
                                             "manager:\n"
                                             "  poll_interval_ms: 10\n"
                                             "  lease_duration_ms: 5000\n"
                                             "  retry_base_delay_ms: 20\n"
                                             "  retry_max_delay_ms: 200\n");
  return negotiation::factory::Build(config, network);
}

// Two connectors wired through one loopback network, driven by hand.
struct Pair {
  std::shared_ptr<LoopbackNetwork> network  = std::make_shared<LoopbackNetwork>();
  Application                      consumer = BuildConnector("consumer", network);
  Application                      provider = BuildConnector("provider", network);

  Pair() {
    network->Register(consumer.address, consumer.service.get());
    network->Register(provider.address, provider.service.get());
  }

  ~Pair() {
    network->Unregister(consumer.address);
    network->Unregister(provider.address);
  }

  void ConsumerStep() {
    consumer.consumer_manager->RunOnce();
  }

  void ProviderStep() {
    provider.provider_manager->RunOnce();
  }

  std::string Initiate(const std::string& asset) {
    v1::ContractRequest request;
    request.set_counter_party_id(provider.participant_id);
    request.set_counter_party_address(provider.address);
    request.mutable_contract_offer()->set_asset_id(asset);
    request.mutable_contract_offer()->mutable_policy()->set_target(asset);
    request.mutable_contract_offer()->set_id("offer-" + asset);
    initial_offer = request.contract_offer();

    auto created = consumer.service->InitiateNegotiation(request);
    assert(created.Succeeded());
    return created.Content().id();
  }

  // the offer sent by the last Initiate
  v1::ContractOffer initial_offer;

  std::string ConsumerState(const std::string& id) {
    return *consumer.service->GetState(id);
  }

  std::string ProviderState(const std::string& id) {
    return *provider.service->GetState(id);
  }
};

void TestHappyPathReachesFinalizedOnBothSides() {
  Pair pair;
  auto consumer_id = pair.Initiate("asset-1");
  assert(pair.ConsumerState(consumer_id) == "REQUESTING");

  pair.ConsumerStep();
  assert(pair.ConsumerState(consumer_id) == "REQUESTED");

  const auto provider_id = pair.consumer.service->FindById(consumer_id)->correlation_id();
  assert(!provider_id.empty());
  assert(pair.ProviderState(provider_id) == "CONSUMER_REQUESTED");
  assert(pair.provider.service->FindById(provider_id)->correlation_id() == consumer_id);
  assert(pair.provider.service->FindById(provider_id)->counter_party_id() == "urn:connector:consumer");

  pair.ProviderStep();
  assert(pair.ProviderState(provider_id) == "AGREED");
  assert(pair.ConsumerState(consumer_id) == "AGREED");

  pair.ConsumerStep();
  assert(pair.ConsumerState(consumer_id) == "VERIFIED");
  assert(pair.ProviderState(provider_id) == "VERIFIED");

  pair.ProviderStep();
  assert(pair.ProviderState(provider_id) == "FINALIZED");
  assert(pair.ConsumerState(consumer_id) == "FINALIZED");

  auto consumer_agreement = pair.consumer.service->GetForNegotiation(consumer_id);
  auto provider_agreement = pair.provider.service->GetForNegotiation(provider_id);
  assert(consumer_agreement && provider_agreement);
  assert(consumer_agreement->id() == provider_agreement->id());
  assert(consumer_agreement->asset_id() == "asset-1");
  assert(consumer_agreement->provider_agent_id() == "urn:connector:provider");
  assert(consumer_agreement->consumer_agent_id() == "urn:connector:consumer");
  assert(pair.consumer.service->FindAgreement(consumer_agreement->id()).has_value());

  // the consumer holds exactly the agreement the provider sent, and the initiating offer first
  assert(MessageDifferencer::Equals(*consumer_agreement, *provider_agreement));
  const auto consumer_record = *pair.consumer.service->FindById(consumer_id);
  const auto provider_record = *pair.provider.service->FindById(provider_id);
  assert(MessageDifferencer::Equals(consumer_record.contract_offers(0), pair.initial_offer));
  assert(MessageDifferencer::Equals(provider_record.contract_offers(0), pair.initial_offer));

  // terminal states are kept and cannot be cancelled
  assert(pair.consumer.service->Cancel(consumer_id).Reason() == negotiation::util::FailureReason::kConflict);
}

void TestCounterOfferIsAcceptedByConsumer() {
  Pair pair;
  auto consumer_id = pair.Initiate("asset-1");
  pair.ConsumerStep();
  const auto provider_id = pair.consumer.service->FindById(consumer_id)->correlation_id();

  v1::ContractOffer counter;
  counter.set_asset_id("asset-1");
  counter.set_contract_end(4'102'444'800);
  assert(pair.provider.service->CounterOffer(provider_id, counter).Succeeded());

  pair.ProviderStep();
  assert(pair.ProviderState(provider_id) == "OFFERED");
  assert(pair.ConsumerState(consumer_id) == "OFFERED");

  pair.ConsumerStep();
  assert(pair.ConsumerState(consumer_id) == "ACCEPTED");
  assert(pair.ProviderState(provider_id) == "CONSUMER_REQUESTED");

  pair.ProviderStep();
  pair.ConsumerStep();
  pair.ProviderStep();
  assert(pair.ConsumerState(consumer_id) == "FINALIZED");
  assert(pair.ProviderState(provider_id) == "FINALIZED");

  assert(pair.consumer.service->GetForNegotiation(consumer_id)->contract_end_date() == 4'102'444'800);
}

void TestProviderDeclineTerminatesBothSides() {
  Pair pair;
  auto consumer_id = pair.Initiate("asset-1");
  pair.ConsumerStep();
  const auto provider_id = pair.consumer.service->FindById(consumer_id)->correlation_id();

  auto declined = pair.provider.service->Decline(provider_id, "asset withdrawn");
  assert(declined.Succeeded());
  assert(declined.Content().state() == Code(NegotiationState::kConsumerRequested));

  pair.ProviderStep();
  assert(pair.ProviderState(provider_id) == "TERMINATED");
  assert(pair.ConsumerState(consumer_id) == "TERMINATED");
  assert(pair.consumer.service->FindById(consumer_id)->error_detail() == "asset withdrawn");
}

void TestConsumerCancelBeforeAgreement() {
  Pair pair;
  auto consumer_id = pair.Initiate("asset-1");
  pair.ConsumerStep();

  auto cancelled = pair.consumer.service->Cancel(consumer_id);
  assert(cancelled.Succeeded());
  assert(cancelled.Content().state() == Code(NegotiationState::kRequested));

  pair.ConsumerStep();
  assert(pair.ConsumerState(consumer_id) == "CANCELLED");
}

void TestCancelLosesRaceWithAgreement() {
  Pair pair;
  auto consumer_id = pair.Initiate("asset-1");
  pair.ConsumerStep();

  // queued while REQUESTED, applied after the agreement arrived
  assert(pair.consumer.service->Cancel(consumer_id).Succeeded());
  pair.ProviderStep();
  assert(pair.ConsumerState(consumer_id) == "AGREED");

  pair.ConsumerStep();
  assert(pair.ConsumerState(consumer_id) == "VERIFIED");
}

void TestQueryAcrossNegotiations() {
  Pair pair;
  pair.Initiate("asset-1");
  pair.Initiate("asset-2");
  pair.ConsumerStep();
  pair.ProviderStep();

  negotiation::db::QuerySpec spec;
  spec.filter.push_back({"contractAgreement.assetId", "=", "asset-2"});
  auto found = pair.provider.service->Query(spec);
  assert(found.Succeeded());
  assert(found.Content().size() == 1);
  assert(found.Content()[0].type() == v1::NEGOTIATION_TYPE_PROVIDER);

  spec.filter.clear();
  spec.filter.push_back({"contractAgreement.assetID", "=", "asset-2"});
  assert(pair.provider.service->Query(spec).Reason() == negotiation::util::FailureReason::kBadRequest);
}

bool WaitUntil(const std::function<bool()>& done) {
  for (int i = 0; i < 1000; ++i) {
    if (done()) return true;
    std::this_thread::sleep_for(10ms);
  }
  return done();
}

void TestRunningConnectorsFinalizeOnTheirOwn() {
  auto network  = std::make_shared<LoopbackNetwork>();
  auto consumer = std::make_unique<Connector>(BuildConnector("consumer", network));
  auto provider = std::make_unique<Connector>(BuildConnector("provider", network));
  consumer->Start();
  provider->Start();

  v1::ContractRequest request;
  request.set_counter_party_id("urn:connector:provider");
  request.set_counter_party_address("loopback://provider");
  request.mutable_contract_offer()->set_asset_id("asset-1");

  auto        service = consumer->App().service;
  const auto  created = service->InitiateNegotiation(request);
  assert(created.Succeeded());
  const auto& id = created.Content().id();

  const bool finalized = WaitUntil([&] { return service->GetState(id) == std::string("FINALIZED"); });

  // both stop before either is destroyed, deliveries may still be in flight
  consumer->Stop();
  provider->Stop();
  assert(finalized);

  const auto provider_id = service->FindById(id)->correlation_id();
  assert(provider->App().service->GetState(provider_id) == std::string("FINALIZED"));
}

} // namespace

int main() {
  TestHappyPathReachesFinalizedOnBothSides();
  TestCounterOfferIsAcceptedByConsumer();
  TestProviderDeclineTerminatesBothSides();
  TestConsumerCancelBeforeAgreement();
  TestCancelLosesRaceWithAgreement();
  TestQueryAcrossNegotiations();
  TestRunningConnectorsFinalizeOnTheirOwn();

  std::cout << "negotiation_integration_round_trip: pass\n";
  return 0;
}
