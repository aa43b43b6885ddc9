#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/query.hpp"
#include "internal/db/api/result.hpp"
#include "negotiation/v1.hpp"

namespace negotiation::db {

/*
  Negotiation store contract.

  CRITICAL GUARANTEES:

  - Save is a compare-and-swap on state_count: it succeeds only when the
    stored state_count equals the caller's copy, and bumps it by exactly 1
  - A record leased by another holder cannot be saved until the lease is
    broken or expires
  - LeaseNextByState never hands the same record to two holders at once

  The store is the source of truth for:
    negotiation state
    offers and agreements
*/

class NegotiationStore {
 public:
  virtual ~NegotiationStore() = default;

  // ---------------------------------------------------------------------
  // Lookups
  // ---------------------------------------------------------------------

  virtual std::optional<v1::ContractNegotiation> FindById(const std::string& id) = 0;

  virtual std::optional<v1::ContractNegotiation> FindForCorrelationId(const std::string& correlation_id) = 0;

  virtual std::optional<v1::ContractAgreement> FindContractAgreement(const std::string& agreement_id) = 0;

  // Paths in the spec must have been validated by the caller.
  virtual std::vector<v1::ContractNegotiation> Query(const QuerySpec& spec) = 0;

  // ---------------------------------------------------------------------
  // Writes
  // ---------------------------------------------------------------------

  // Inserts when state_count == 0, otherwise CAS update. On success the
  // caller's copy carries the new state_count.
  virtual Result Save(v1::ContractNegotiation& negotiation, const std::string& lease_holder) = 0;

  // ---------------------------------------------------------------------
  // Leasing
  // ---------------------------------------------------------------------

  // Claims up to batch_size unleased records in `state` owned by `type`,
  // oldest state_timestamp first.
  virtual std::vector<v1::ContractNegotiation> LeaseNextByState(int32_t state, v1::NegotiationType type, std::size_t batch_size,
                                                                const std::string& lease_holder) = 0;

  virtual Result BreakLease(const std::string& id, const std::string& lease_holder) = 0;
};

} // namespace negotiation::db
