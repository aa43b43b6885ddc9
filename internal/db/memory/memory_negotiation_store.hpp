#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <unordered_map>

#include "internal/db/api/negotiation_store.hpp"
#include "internal/util/time.hpp"

namespace negotiation::db::memory {

/*
  In-process negotiation store.

  All operations take a single mutex, so every call is atomic with respect to
  the others. Records are copied in and out; callers never see shared state.
*/
class MemoryNegotiationStore final : public db::NegotiationStore {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  explicit MemoryNegotiationStore(std::chrono::milliseconds lease_duration = std::chrono::seconds(60), ClockFn clock = util::Now);

  std::optional<v1::ContractNegotiation> FindById(const std::string& id) override;
  std::optional<v1::ContractNegotiation> FindForCorrelationId(const std::string& correlation_id) override;
  std::optional<v1::ContractAgreement>   FindContractAgreement(const std::string& agreement_id) override;
  std::vector<v1::ContractNegotiation>   Query(const QuerySpec& spec) override;

  Result Save(v1::ContractNegotiation& negotiation, const std::string& lease_holder) override;

  std::vector<v1::ContractNegotiation> LeaseNextByState(int32_t state, v1::NegotiationType type, std::size_t batch_size,
                                                        const std::string& lease_holder) override;
  Result                               BreakLease(const std::string& id, const std::string& lease_holder) override;

  std::size_t Size() const;

 private:
  struct Lease {
    std::string     holder;
    util::TimePoint expires_at;
  };

  // requires mutex_
  bool IsLeasedByOther(const std::string& id, const std::string& holder, util::TimePoint now) const;

  std::chrono::milliseconds lease_duration_;
  ClockFn                   clock_;

  mutable std::mutex                                       mutex_;
  std::unordered_map<std::string, v1::ContractNegotiation> negotiations_;
  std::unordered_map<std::string, Lease>                   leases_;
};

} // namespace negotiation::db::memory
