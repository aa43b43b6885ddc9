#include "memory_negotiation_store.hpp"

#include <algorithm>

#include "internal/query/field_path.hpp"

namespace negotiation::db::memory {

MemoryNegotiationStore::MemoryNegotiationStore(std::chrono::milliseconds lease_duration, ClockFn clock)
    : lease_duration_(lease_duration), clock_(std::move(clock)) {
}

bool MemoryNegotiationStore::IsLeasedByOther(const std::string& id, const std::string& holder, util::TimePoint now) const {
  auto it = leases_.find(id);
  if (it == leases_.end()) return false;
  if (it->second.expires_at <= now) return false;
  return it->second.holder != holder;
}

std::optional<v1::ContractNegotiation> MemoryNegotiationStore::FindById(const std::string& id) {
  std::lock_guard lock(mutex_);
  auto            it = negotiations_.find(id);
  if (it == negotiations_.end()) return std::nullopt;
  return it->second;
}

std::optional<v1::ContractNegotiation> MemoryNegotiationStore::FindForCorrelationId(const std::string& correlation_id) {
  if (correlation_id.empty()) return std::nullopt;

  std::lock_guard lock(mutex_);
  for (const auto& [_, negotiation] : negotiations_) {
    if (negotiation.correlation_id() == correlation_id) return negotiation;
  }
  return std::nullopt;
}

std::optional<v1::ContractAgreement> MemoryNegotiationStore::FindContractAgreement(const std::string& agreement_id) {
  std::lock_guard lock(mutex_);
  for (const auto& [_, negotiation] : negotiations_) {
    if (negotiation.has_contract_agreement() && negotiation.contract_agreement().id() == agreement_id) {
      return negotiation.contract_agreement();
    }
  }
  return std::nullopt;
}

std::vector<v1::ContractNegotiation> MemoryNegotiationStore::Query(const QuerySpec& spec) {
  std::vector<v1::ContractNegotiation> matched;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [_, negotiation] : negotiations_) {
      const bool all = std::all_of(spec.filter.begin(), spec.filter.end(),
                                   [&](const Criterion& criterion) { return query::Matches(negotiation, criterion); });
      if (all) matched.push_back(negotiation);
    }
  }

  // stable paging order
  std::sort(matched.begin(), matched.end(), [](const auto& a, const auto& b) {
    if (a.created_at() != b.created_at()) return a.created_at() < b.created_at();
    return a.id() < b.id();
  });

  if (spec.offset >= matched.size()) return {};
  // limit may be SIZE_MAX, never add it to offset unclamped
  const auto end = spec.offset + std::min(spec.limit, matched.size() - spec.offset);
  return {matched.begin() + static_cast<std::ptrdiff_t>(spec.offset), matched.begin() + static_cast<std::ptrdiff_t>(end)};
}

Result MemoryNegotiationStore::Save(v1::ContractNegotiation& negotiation, const std::string& lease_holder) {
  if (negotiation.id().empty()) {
    return Result::Err(ErrorCode::InvalidArgument, "negotiation id is empty");
  }

  std::lock_guard lock(mutex_);
  const auto      now = clock_();

  auto it = negotiations_.find(negotiation.id());
  if (negotiation.state_count() == 0) {
    if (it != negotiations_.end()) {
      return Result::Err(ErrorCode::AlreadyExists, "negotiation " + negotiation.id() + " already exists");
    }
    negotiation.set_state_count(1);
    negotiations_.emplace(negotiation.id(), negotiation);
    return Result::Ok();
  }

  if (it == negotiations_.end()) {
    return Result::Err(ErrorCode::NotFound, "negotiation " + negotiation.id() + " not found");
  }
  if (IsLeasedByOther(negotiation.id(), lease_holder, now)) {
    return Result::Err(ErrorCode::LeaseConflict, "negotiation " + negotiation.id() + " is leased by " + leases_[negotiation.id()].holder);
  }
  if (it->second.state_count() != negotiation.state_count()) {
    return Result::Err(ErrorCode::Conflict, "stale state_count " + std::to_string(negotiation.state_count()) + ", stored " +
                                                std::to_string(it->second.state_count()));
  }

  negotiation.set_state_count(negotiation.state_count() + 1);
  it->second = negotiation;
  return Result::Ok();
}

std::vector<v1::ContractNegotiation> MemoryNegotiationStore::LeaseNextByState(int32_t state, v1::NegotiationType type, std::size_t batch_size,
                                                                              const std::string& lease_holder) {
  std::lock_guard lock(mutex_);
  const auto      now = clock_();

  std::vector<const v1::ContractNegotiation*> candidates;
  for (const auto& [id, negotiation] : negotiations_) {
    if (negotiation.state() != state || negotiation.type() != type) continue;

    auto lease = leases_.find(id);
    if (lease != leases_.end() && lease->second.expires_at > now) continue;

    candidates.push_back(&negotiation);
  }

  std::sort(candidates.begin(), candidates.end(), [](const auto* a, const auto* b) { return a->state_timestamp() < b->state_timestamp(); });
  if (candidates.size() > batch_size) candidates.resize(batch_size);

  std::vector<v1::ContractNegotiation> leased;
  leased.reserve(candidates.size());
  for (const auto* negotiation : candidates) {
    leases_[negotiation->id()] = Lease{lease_holder, now + lease_duration_};
    leased.push_back(*negotiation);
  }
  return leased;
}

Result MemoryNegotiationStore::BreakLease(const std::string& id, const std::string& lease_holder) {
  std::lock_guard lock(mutex_);
  auto            it = leases_.find(id);
  if (it == leases_.end()) {
    return Result::Ok();
  }
  if (it->second.holder != lease_holder && it->second.expires_at > clock_()) {
    return Result::Err(ErrorCode::LeaseConflict, "lease on " + id + " held by " + it->second.holder);
  }
  leases_.erase(it);
  return Result::Ok();
}

std::size_t MemoryNegotiationStore::Size() const {
  std::lock_guard lock(mutex_);
  return negotiations_.size();
}

} // namespace negotiation::db::memory
