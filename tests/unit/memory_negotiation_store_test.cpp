#include "internal/db/memory/memory_negotiation_store.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <limits>
#include <memory>
#include <string>

#include "internal/model/negotiation_state.hpp"

namespace {

using namespace std::chrono_literals;
using negotiation::db::Criterion;
using negotiation::db::ErrorCode;
using negotiation::db::QuerySpec;
using negotiation::db::memory::MemoryNegotiationStore;
using negotiation::model::Code;
using negotiation::model::NegotiationState;
using negotiation::util::FromUnixMillis;
using negotiation::util::TimePoint;
namespace v1 = negotiation::v1;

struct ManualClock {
  std::shared_ptr<TimePoint> now = std::make_shared<TimePoint>(FromUnixMillis(1'000'000));

  MemoryNegotiationStore::ClockFn Fn() const {
    auto shared = now;
    return [shared] { return *shared; };
  }

  void Advance(std::chrono::milliseconds by) {
    *now += by;
  }
};

v1::ContractNegotiation MakeNegotiation(const std::string& id, v1::NegotiationType type, NegotiationState state, int64_t timestamp = 0) {
  v1::ContractNegotiation n;
  n.set_id(id);
  n.set_type(type);
  n.set_state(Code(state));
  n.set_state_timestamp(timestamp);
  n.set_created_at(timestamp);
  return n;
}

void TestInsertThenCasUpdate() {
  MemoryNegotiationStore store;
  auto n = MakeNegotiation("n-1", v1::NEGOTIATION_TYPE_CONSUMER, NegotiationState::kRequesting);

  assert(store.Save(n, {}));
  assert(n.state_count() == 1);

  auto duplicate = MakeNegotiation("n-1", v1::NEGOTIATION_TYPE_CONSUMER, NegotiationState::kRequesting);
  assert(store.Save(duplicate, {}).code == ErrorCode::AlreadyExists);

  auto first  = *store.FindById("n-1");
  auto second = *store.FindById("n-1");

  first.set_state(Code(NegotiationState::kRequested));
  assert(store.Save(first, {}));
  assert(first.state_count() == 2);

  // second still carries state_count 1
  second.set_state(Code(NegotiationState::kCancelled));
  assert(store.Save(second, {}).code == ErrorCode::Conflict);

  auto stored = *store.FindById("n-1");
  assert(stored.state() == Code(NegotiationState::kRequested));
  assert(stored.state_count() == 2);
}

void TestSaveRejectsUnknownAndEmptyIds() {
  MemoryNegotiationStore store;

  auto missing = MakeNegotiation("missing", v1::NEGOTIATION_TYPE_CONSUMER, NegotiationState::kRequested);
  missing.set_state_count(4);
  assert(store.Save(missing, {}).code == ErrorCode::NotFound);

  auto unnamed = MakeNegotiation("", v1::NEGOTIATION_TYPE_CONSUMER, NegotiationState::kRequested);
  assert(store.Save(unnamed, {}).code == ErrorCode::InvalidArgument);
  assert(store.Size() == 0);
}

void TestLeaseBlocksOtherWriters() {
  ManualClock            clock;
  MemoryNegotiationStore store(10s, clock.Fn());

  auto n = MakeNegotiation("n-1", v1::NEGOTIATION_TYPE_PROVIDER, NegotiationState::kConsumerRequested);
  assert(store.Save(n, {}));

  auto leased = store.LeaseNextByState(Code(NegotiationState::kConsumerRequested), v1::NEGOTIATION_TYPE_PROVIDER, 5, "holder-a");
  assert(leased.size() == 1);

  auto update = leased.front();
  update.set_state(Code(NegotiationState::kAgreeing));
  auto copy = update;

  assert(store.Save(update, "holder-b").code == ErrorCode::LeaseConflict);
  assert(store.Save(update, {}).code == ErrorCode::LeaseConflict);
  assert(store.BreakLease("n-1", "holder-b").code == ErrorCode::LeaseConflict);

  assert(store.Save(copy, "holder-a"));
  assert(store.BreakLease("n-1", "holder-a"));

  // breaking an absent lease is fine
  assert(store.BreakLease("n-1", "holder-b"));
}

void TestLeaseIsNeverHandedOutTwice() {
  ManualClock            clock;
  MemoryNegotiationStore store(10s, clock.Fn());

  auto n = MakeNegotiation("n-1", v1::NEGOTIATION_TYPE_CONSUMER, NegotiationState::kRequesting);
  assert(store.Save(n, {}));

  const auto state = Code(NegotiationState::kRequesting);
  assert(store.LeaseNextByState(state, v1::NEGOTIATION_TYPE_CONSUMER, 5, "holder-a").size() == 1);
  assert(store.LeaseNextByState(state, v1::NEGOTIATION_TYPE_CONSUMER, 5, "holder-b").empty());
  assert(store.LeaseNextByState(state, v1::NEGOTIATION_TYPE_CONSUMER, 5, "holder-a").empty());

  // an expired lease can be taken over
  clock.Advance(11s);
  assert(store.LeaseNextByState(state, v1::NEGOTIATION_TYPE_CONSUMER, 5, "holder-b").size() == 1);

  auto stale = *store.FindById("n-1");
  stale.set_state(Code(NegotiationState::kRequested));
  assert(store.Save(stale, "holder-a").code == ErrorCode::LeaseConflict);
}

void TestLeaseFiltersTypeAndOrdersByTimestamp() {
  MemoryNegotiationStore store;
  auto                   newer    = MakeNegotiation("newer", v1::NEGOTIATION_TYPE_PROVIDER, NegotiationState::kTerminating, 30);
  auto                   older    = MakeNegotiation("older", v1::NEGOTIATION_TYPE_PROVIDER, NegotiationState::kTerminating, 10);
  auto                   consumer = MakeNegotiation("consumer", v1::NEGOTIATION_TYPE_CONSUMER, NegotiationState::kTerminating, 0);
  assert(store.Save(newer, {}));
  assert(store.Save(older, {}));
  assert(store.Save(consumer, {}));

  auto leased = store.LeaseNextByState(Code(NegotiationState::kTerminating), v1::NEGOTIATION_TYPE_PROVIDER, 1, "holder");
  assert(leased.size() == 1);
  assert(leased.front().id() == "older");

  leased = store.LeaseNextByState(Code(NegotiationState::kTerminating), v1::NEGOTIATION_TYPE_PROVIDER, 5, "holder");
  assert(leased.size() == 1);
  assert(leased.front().id() == "newer");
}

void TestCorrelationAndAgreementLookups() {
  MemoryNegotiationStore store;

  auto n = MakeNegotiation("n-1", v1::NEGOTIATION_TYPE_CONSUMER, NegotiationState::kAgreed);
  n.set_correlation_id("remote-1");
  n.mutable_contract_agreement()->set_id("agreement-1");
  assert(store.Save(n, {}));

  assert(store.FindForCorrelationId("remote-1")->id() == "n-1");
  assert(!store.FindForCorrelationId("").has_value());
  assert(!store.FindForCorrelationId("remote-2").has_value());

  assert(store.FindContractAgreement("agreement-1")->id() == "agreement-1");
  assert(!store.FindContractAgreement("agreement-2").has_value());
}

void TestQueryFiltersAndPages() {
  MemoryNegotiationStore store;
  for (int i = 0; i < 5; ++i) {
    auto n = MakeNegotiation("n-" + std::to_string(i), i % 2 == 0 ? v1::NEGOTIATION_TYPE_CONSUMER : v1::NEGOTIATION_TYPE_PROVIDER,
                             NegotiationState::kRequested, 100 - i);
    n.set_counter_party_id(i < 3 ? "acme" : "globex");
    assert(store.Save(n, {}));
  }

  auto all = store.Query(QuerySpec::None());
  assert(all.size() == 5);
  // oldest created first
  assert(all.front().id() == "n-4");

  QuerySpec spec;
  spec.filter.push_back(Criterion{"counterPartyId", "=", "acme"});
  spec.filter.push_back(Criterion{"type", "=", "NEGOTIATION_TYPE_CONSUMER"});
  auto acme_consumers = store.Query(spec);
  assert(acme_consumers.size() == 2);
  assert(acme_consumers[0].id() == "n-2");
  assert(acme_consumers[1].id() == "n-0");

  QuerySpec paged;
  paged.offset = 1;
  paged.limit  = 2;
  auto page    = store.Query(paged);
  assert(page.size() == 2);
  assert(page[0].id() == "n-3");
  assert(page[1].id() == "n-2");

  paged.offset = 10;
  assert(store.Query(paged).empty());
}

void TestUnboundedLimitPagesToTheEnd() {
  MemoryNegotiationStore store;
  for (int i = 0; i < 3; ++i) {
    auto n = MakeNegotiation("n-" + std::to_string(i), v1::NEGOTIATION_TYPE_CONSUMER, NegotiationState::kRequested, 10 + i);
    assert(store.Save(n, {}));
  }

  QuerySpec spec;
  spec.offset = 2;
  spec.limit  = std::numeric_limits<std::size_t>::max();
  auto tail   = store.Query(spec);
  assert(tail.size() == 1);
  assert(tail[0].id() == "n-2");

  spec.offset = 0;
  assert(store.Query(spec).size() == 3);

  spec.offset = 3;
  assert(store.Query(spec).empty());

  spec.offset = 1;
  spec.limit  = 0;
  assert(store.Query(spec).empty());
}

} // namespace

int main() {
  TestInsertThenCasUpdate();
  TestSaveRejectsUnknownAndEmptyIds();
  TestLeaseBlocksOtherWriters();
  TestLeaseIsNeverHandedOutTwice();
  TestLeaseFiltersTypeAndOrdersByTimestamp();
  TestCorrelationAndAgreementLookups();
  TestQueryFiltersAndPages();
  TestUnboundedLimitPagesToTheEnd();

  std::cout << "negotiation_unit_memory_store: pass\n";
  return 0;
}
