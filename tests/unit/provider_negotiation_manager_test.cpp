#include "internal/core/provider_negotiation_manager.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/memory/memory_negotiation_store.hpp"

namespace {

using negotiation::core::ManagerOptions;
using negotiation::core::ProviderNegotiationManager;
using negotiation::db::memory::MemoryNegotiationStore;
using negotiation::dispatch::DispatchResult;
using negotiation::dispatch::RemoteMessageDispatcher;
using negotiation::model::Code;
using negotiation::model::DeclineNegotiationCommand;
using negotiation::model::NegotiationState;
using negotiation::util::FailureReason;
namespace v1 = negotiation::v1;

class RecordingDispatcher final : public RemoteMessageDispatcher {
 public:
  DispatchResult Send(const v1::RemoteMessage& message) override {
    std::lock_guard lock(mutex_);
    sent_.push_back(message);
    return DispatchResult::Ok();
  }

  std::vector<v1::RemoteMessage> Sent() const {
    std::lock_guard lock(mutex_);
    return sent_;
  }

 private:
  mutable std::mutex             mutex_;
  std::vector<v1::RemoteMessage> sent_;
};

struct Fixture {
  std::shared_ptr<MemoryNegotiationStore>     store      = std::make_shared<MemoryNegotiationStore>();
  std::shared_ptr<RecordingDispatcher>        dispatcher = std::make_shared<RecordingDispatcher>();
  std::unique_ptr<ProviderNegotiationManager> manager;

  Fixture() {
    ManagerOptions options;
    options.participant_id   = "provider-connector";
    options.callback_address = "loopback://provider";
    manager                  = std::make_unique<ProviderNegotiationManager>(store, dispatcher, options);
  }

  NegotiationState StateOf(const std::string& id) const {
    return static_cast<NegotiationState>(store->FindById(id)->state());
  }
};

v1::ClaimToken MakeToken(const std::string& client_id) {
  v1::ClaimToken token;
  (*token.mutable_claims())["client_id"] = client_id;
  return token;
}

v1::ContractRequestMessage MakeRequest(const std::string& process_id = "consumer-1", const std::string& offer_id = "offer-1") {
  v1::ContractRequestMessage message;
  message.set_process_id(process_id);
  message.set_connector_id("connector-from-message");
  message.set_callback_address("loopback://consumer");
  message.mutable_contract_offer()->set_id(offer_id);
  message.mutable_contract_offer()->set_asset_id("asset-1");
  message.mutable_contract_offer()->mutable_policy()->set_target("asset-1");
  return message;
}

void TestConsumerRequestCreatesRecord() {
  Fixture fx;

  auto created = fx.manager->ConsumerRequested(MakeToken("consumer-connector"), MakeRequest());
  assert(created.Succeeded());

  const auto& n = created.Content();
  assert(n.type() == v1::NEGOTIATION_TYPE_PROVIDER);
  assert(n.state() == Code(NegotiationState::kConsumerRequested));
  assert(n.correlation_id() == "consumer-1");
  assert(n.counter_party_id() == "consumer-connector");
  assert(n.counter_party_address() == "loopback://consumer");
  assert(n.protocol() == "dataspace-protocol-http");
  assert(n.contract_offers_size() == 1);
  assert(n.state_count() == 1);
}

void TestConnectorIdIsFallbackIdentity() {
  Fixture fx;
  auto    created = fx.manager->ConsumerRequested(v1::ClaimToken{}, MakeRequest());
  assert(created.Succeeded());
  assert(created.Content().counter_party_id() == "connector-from-message");
}

void TestMalformedRequestsAreRejected() {
  Fixture fx;
  auto    token = MakeToken("consumer-connector");

  auto no_process = MakeRequest("");
  assert(fx.manager->ConsumerRequested(token, no_process).Reason() == FailureReason::kBadRequest);

  auto no_offer = MakeRequest();
  no_offer.clear_contract_offer();
  assert(fx.manager->ConsumerRequested(token, no_offer).Reason() == FailureReason::kBadRequest);

  auto no_callback = MakeRequest();
  no_callback.clear_callback_address();
  assert(fx.manager->ConsumerRequested(token, no_callback).Reason() == FailureReason::kBadRequest);

  auto anonymous = MakeRequest();
  anonymous.clear_connector_id();
  assert(fx.manager->ConsumerRequested(v1::ClaimToken{}, anonymous).Reason() == FailureReason::kBadRequest);

  assert(fx.store->Size() == 0);
}

void TestResentRequestIsIdempotent() {
  Fixture fx;
  auto    token = MakeToken("consumer-connector");

  auto first  = fx.manager->ConsumerRequested(token, MakeRequest()).Content();
  auto second = fx.manager->ConsumerRequested(token, MakeRequest());
  assert(second.Succeeded());
  assert(second.Content().id() == first.id());
  assert(second.Content().state_count() == first.state_count());
  assert(fx.store->Size() == 1);
}

void TestAutoAgreeAndFinalize() {
  Fixture fx;
  auto    id = fx.manager->ConsumerRequested(MakeToken("consumer-connector"), MakeRequest()).Content().id();

  // CONSUMER_REQUESTED and AGREEING within one pass
  fx.manager->RunOnce();
  assert(fx.StateOf(id) == NegotiationState::kAgreed);

  auto stored = *fx.store->FindById(id);
  assert(stored.contract_agreement().provider_agent_id() == "provider-connector");
  assert(stored.contract_agreement().consumer_agent_id() == "consumer-connector");
  assert(stored.contract_agreement().asset_id() == "asset-1");

  auto sent = fx.dispatcher->Sent();
  assert(sent.size() == 1);
  assert(sent[0].has_agreement());
  assert(sent[0].agreement().process_id() == id);
  assert(sent[0].agreement().counter_party_address() == "loopback://consumer");
  assert(sent[0].agreement().contract_agreement().id() == stored.contract_agreement().id());

  auto verified = fx.manager->Verified(v1::ClaimToken{}, "consumer-1");
  assert(verified.Succeeded());
  assert(fx.StateOf(id) == NegotiationState::kVerified);

  fx.manager->RunOnce();
  assert(fx.StateOf(id) == NegotiationState::kFinalized);
  sent = fx.dispatcher->Sent();
  assert(sent.size() == 2);
  assert(sent[1].has_event());
  assert(sent[1].event().type() == v1::ContractNegotiationEventMessage::TYPE_FINALIZED);
}

void TestCounterOfferRoundTrip() {
  Fixture fx;
  auto    token = MakeToken("consumer-connector");
  auto    id    = fx.manager->ConsumerRequested(token, MakeRequest()).Content().id();

  v1::ContractOffer counter;
  counter.set_asset_id("asset-1");
  auto countered = fx.manager->CounterOffer(id, counter);
  assert(countered.Succeeded());
  assert(countered.Content().state() == Code(NegotiationState::kOffering));
  const auto counter_id = countered.Content().contract_offers(1).id();
  assert(!counter_id.empty());

  fx.manager->RunOnce();
  assert(fx.StateOf(id) == NegotiationState::kOffered);
  auto sent = fx.dispatcher->Sent();
  assert(sent.size() == 1);
  assert(sent[0].has_offer());
  assert(sent[0].offer().contract_offer().id() == counter_id);

  // consumer accepts by requesting the counter-offer
  auto accepted = fx.manager->ConsumerRequested(token, MakeRequest("consumer-1", counter_id));
  assert(accepted.Succeeded());
  assert(accepted.Content().id() == id);
  assert(accepted.Content().state() == Code(NegotiationState::kConsumerRequested));
  assert(accepted.Content().contract_offers_size() == 3);
}

void TestCounterOfferErrors() {
  Fixture fx;
  assert(fx.manager->CounterOffer("missing", v1::ContractOffer{}).Reason() == FailureReason::kNotFound);

  auto id = fx.manager->ConsumerRequested(MakeToken("consumer-connector"), MakeRequest()).Content().id();
  fx.manager->RunOnce();
  assert(fx.manager->CounterOffer(id, v1::ContractOffer{}).Reason() == FailureReason::kConflict);
}

void TestVerificationBeforeAgreementConflicts() {
  Fixture fx;
  fx.manager->ConsumerRequested(MakeToken("consumer-connector"), MakeRequest());
  assert(fx.manager->Verified(v1::ClaimToken{}, "consumer-1").Reason() == FailureReason::kConflict);
  assert(fx.manager->Verified(v1::ClaimToken{}, "consumer-2").Reason() == FailureReason::kNotFound);
}

void TestTerminationFromConsumer() {
  Fixture fx;
  auto    id = fx.manager->ConsumerRequested(MakeToken("consumer-connector"), MakeRequest()).Content().id();

  auto declined = fx.manager->Declined(v1::ClaimToken{}, "consumer-1", "no budget");
  assert(declined.Succeeded());
  assert(fx.StateOf(id) == NegotiationState::kTerminated);
  assert(fx.store->FindById(id)->error_detail() == "no budget");

  // a repeated termination changes nothing
  auto again = fx.manager->Declined(v1::ClaimToken{}, "consumer-1", "no budget");
  assert(again.Succeeded());
  assert(again.Content().state_count() == declined.Content().state_count());
}

void TestDeclineCommandSendsTermination() {
  Fixture fx;
  auto    id = fx.manager->ConsumerRequested(MakeToken("consumer-connector"), MakeRequest()).Content().id();

  fx.manager->EnqueueCommand(DeclineNegotiationCommand{id, "asset withdrawn"});
  fx.manager->RunOnce();

  assert(fx.StateOf(id) == NegotiationState::kTerminated);
  auto sent = fx.dispatcher->Sent();
  assert(sent.size() == 1);
  assert(sent[0].has_termination());
  assert(sent[0].termination().process_id() == id);
  assert(sent[0].termination().reason() == "asset withdrawn");
}

void TestCommandForConsumerRecordIsDropped() {
  Fixture fx;

  v1::ContractNegotiation consumer_record;
  consumer_record.set_id("consumer-record");
  consumer_record.set_type(v1::NEGOTIATION_TYPE_CONSUMER);
  consumer_record.set_state(Code(NegotiationState::kRequested));
  assert(fx.store->Save(consumer_record, {}));

  fx.manager->EnqueueCommand(DeclineNegotiationCommand{"consumer-record", "not mine"});
  fx.manager->RunOnce();

  assert(!fx.manager->HasPendingCommand("consumer-record"));
  assert(fx.StateOf("consumer-record") == NegotiationState::kRequested);
  assert(fx.store->FindById("consumer-record")->state_count() == 1);
  assert(fx.dispatcher->Sent().empty());
}

} // namespace

int main() {
  TestConsumerRequestCreatesRecord();
  TestConnectorIdIsFallbackIdentity();
  TestMalformedRequestsAreRejected();
  TestResentRequestIsIdempotent();
  TestAutoAgreeAndFinalize();
  TestCounterOfferRoundTrip();
  TestCounterOfferErrors();
  TestVerificationBeforeAgreementConflicts();
  TestTerminationFromConsumer();
  TestDeclineCommandSendsTermination();
  TestCommandForConsumerRecordIsDropped();

  std::cout << "negotiation_unit_provider_manager: pass\n";
  return 0;
}
