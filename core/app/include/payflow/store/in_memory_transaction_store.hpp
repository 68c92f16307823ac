#pragma once

#include "payflow/store/i_transaction_store.hpp"

#include <unordered_map>

namespace payflow {

// -----------------------------------------------------------------------------
// InMemoryTransactionStore — process-lifetime ITransactionStore
// -----------------------------------------------------------------------------
//
// @brief  Keeps every Transaction in an unordered_map keyed by id.
//
// @details
// Records are stored by value. findById() returns a copy, so callers can
// never mutate the stored record except through save().
//
// Nothing is ever erased: the lifecycle has no delete operation.
//
// Ownership:
//   Owned by PaymentEngine as a value member and handed to TransactionService
//   by reference. Never a singleton.
// -----------------------------------------------------------------------------
class InMemoryTransactionStore final : public ITransactionStore {
 public:
  InMemoryTransactionStore() = default;

  InMemoryTransactionStore(const InMemoryTransactionStore&) = delete;
  InMemoryTransactionStore& operator=(const InMemoryTransactionStore&) = delete;

  void save(const domain::Transaction& transaction) override;

  std::optional<domain::Transaction> findById(
      const domain::TransactionId& id) const override;

  bool exists(const domain::TransactionId& id) const override;

  std::size_t size() const override;

 private:
  std::unordered_map<domain::TransactionId, domain::Transaction> records_;
};

}  // namespace payflow
