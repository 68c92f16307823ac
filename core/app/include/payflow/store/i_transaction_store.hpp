#pragma once

#include "payflow/domain/transaction.hpp"

#include <cstddef>
#include <optional>

namespace payflow {

// -----------------------------------------------------------------------------
// ITransactionStore — storage contract consumed by TransactionService
// -----------------------------------------------------------------------------
//
// @brief  Key-value store mapping a TransactionId to the current
//         Transaction record.
//
// @details
// TransactionService performs every transition as findById() followed by
// save(). Any backing store that honours the contract below can be injected
// without touching the service:
//   * InMemoryTransactionStore — unordered_map, process lifetime only
//   * a test double counting writes (see tests/)
//
// Absence is an expected outcome of findById(), not an error. The service
// turns it into TransactionNotFoundError.
//
// Ownership:
//   The service holds a reference; the caller (PaymentEngine or a test)
//   owns the store and must keep it alive for the service's lifetime.
//
// Thread model:
//   No synchronization is required by the contract. Concurrent callers
//   would need per-id isolation on top of find/save.
// -----------------------------------------------------------------------------
class ITransactionStore {
 public:
  virtual ~ITransactionStore() = default;

  // -------------------------------------------------------------------------
  // save(transaction)
  // -------------------------------------------------------------------------
  // @brief  Inserts the record, or overwrites the one with the same id.
  //
  // Must not fail under normal operation.
  // -------------------------------------------------------------------------
  virtual void save(const domain::Transaction& transaction) = 0;

  // -------------------------------------------------------------------------
  // findById(id)
  // -------------------------------------------------------------------------
  // @brief  Returns a copy of the stored record, or std::nullopt if no
  //         record exists for id.
  // -------------------------------------------------------------------------
  virtual std::optional<domain::Transaction> findById(
      const domain::TransactionId& id) const = 0;

  // Equivalent to findById(id).has_value().
  virtual bool exists(const domain::TransactionId& id) const = 0;

  // Number of stored records.
  virtual std::size_t size() const = 0;
};

}  // namespace payflow
