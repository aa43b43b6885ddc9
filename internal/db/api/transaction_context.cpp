#include "internal/db/api/transaction_context.hpp"

#include <stdexcept>

namespace negotiation::db {

void NoopTransactionContext::Execute(const std::function<void()>& block) {
  block();
}

ScopedTransactionContext::ScopedTransactionContext(Factory begin) : begin_(std::move(begin)) {
  if (!begin_) {
    throw std::invalid_argument("ScopedTransactionContext requires a transaction factory");
  }
}

void ScopedTransactionContext::Execute(const std::function<void()>& block) {
  auto tx = begin_();
  try {
    block();
  } catch (...) {
    tx->Rollback();
    throw;
  }
  tx->Commit();
}

} // namespace negotiation::db
