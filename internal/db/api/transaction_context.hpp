#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include "internal/db/api/transaction.hpp"

namespace negotiation::db {

/*
  Scoped unit of work around a block of store calls.

  Service façade methods run through Execute; the block either completes and
  commits, or throws and rolls back.
*/
class TransactionContext {
 public:
  virtual ~TransactionContext() = default;

  virtual void Execute(const std::function<void()>& block) = 0;

  template <typename Fn>
  auto Run(Fn&& fn) -> std::invoke_result_t<Fn> {
    using R = std::invoke_result_t<Fn>;
    if constexpr (std::is_void_v<R>) {
      Execute([&] { fn(); });
    } else {
      std::optional<R> result;
      Execute([&] { result.emplace(fn()); });
      return std::move(*result);
    }
  }
};

// Used when the configured store is not transactional.
class NoopTransactionContext final : public TransactionContext {
 public:
  void Execute(const std::function<void()>& block) override;
};

class ScopedTransactionContext final : public TransactionContext {
 public:
  using Factory = std::function<std::unique_ptr<Transaction>()>;

  explicit ScopedTransactionContext(Factory begin);

  void Execute(const std::function<void()>& block) override;

 private:
  Factory begin_;
};

} // namespace negotiation::db
