#pragma once

#include "payflow/concurrent/transaction_id_generator.hpp"
#include "payflow/domain/transaction.hpp"
#include "payflow/domain/transaction_status.hpp"
#include "payflow/store/i_transaction_store.hpp"

#include <string>

namespace payflow {

// -----------------------------------------------------------------------------
// TransactionService — payment lifecycle state machine and refund accounting
// -----------------------------------------------------------------------------
//
// @brief  Accepts lifecycle commands (create, authorize, capture, refund,
//         get), enforces state-machine legality and amount bounds, and
//         writes every accepted change back through ITransactionStore.
//
// @details
// Each mutating operation follows the same read-validate-write sequence:
//
//   1. Validate arguments (InvalidArgumentError).
//   2. findById() the record (TransactionNotFoundError if absent).
//   3. Check isPermitted(status, action) (InvalidStateError).
//   4. Check amount bounds for refunds (InvalidRefundAmountError).
//   5. Mutate the local copy and save() it.
//
// Nothing is written before step 5, so a rejected command leaves the store
// exactly as it was.
//
// Refund accounting:
//   Refunds accumulate: refunded_amount += amount. The request is rejected
//   when amount > refundableAmount(), which keeps refunded_amount <=
//   captured_amount. The transition to Refunded is derived from the running
//   total with a >= comparison, never commanded explicitly.
//
// Thread model:
//   Single-threaded. find/save is a read-modify-write with no isolation;
//   concurrent callers would need per-id locking.
//
// Ownership:
//   Holds references to the store and the id generator. Both are owned by
//   PaymentEngine (or a test fixture) and must outlive the service.
// -----------------------------------------------------------------------------
class TransactionService {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  store            Backing store for every record.
  // @param  id_gen           Source of fresh transaction ids.
  // @param  log_transitions  When true, each accepted transition is logged
  //                          to stdout. Rejections are always logged to
  //                          stderr.
  // -------------------------------------------------------------------------
  TransactionService(ITransactionStore& store, TransactionIdGenerator& id_gen,
                     bool log_transitions = false);

  TransactionService(const TransactionService&) = delete;
  TransactionService& operator=(const TransactionService&) = delete;

  // -------------------------------------------------------------------------
  // create(owner_id, amount)
  // -------------------------------------------------------------------------
  // @brief  Builds and persists a new transaction in Created status.
  //
  // @return The stored record (refunded_amount == 0).
  //
  // @throws InvalidArgumentError if owner_id is empty or amount is not
  //         strictly positive (NaN included).
  // -------------------------------------------------------------------------
  domain::Transaction create(const std::string& owner_id, double amount);

  // -------------------------------------------------------------------------
  // authorize(id)
  // -------------------------------------------------------------------------
  // @brief  Created → Authorized.
  //
  // @throws TransactionNotFoundError, InvalidStateError.
  // -------------------------------------------------------------------------
  void authorize(const domain::TransactionId& id);

  // -------------------------------------------------------------------------
  // capture(id)
  // -------------------------------------------------------------------------
  // @brief  Authorized → Captured.
  //
  // @throws TransactionNotFoundError, InvalidStateError.
  // -------------------------------------------------------------------------
  void capture(const domain::TransactionId& id);

  // -------------------------------------------------------------------------
  // refund(id, amount)
  // -------------------------------------------------------------------------
  // @brief  Adds amount to the refund total of a Captured transaction.
  //
  // @details
  // After the addition, the record moves to Refunded when
  // refunded_amount >= captured_amount, and stays Captured otherwise.
  //
  // @throws InvalidArgumentError if amount <= 0 (checked first, before the
  //         lookup), TransactionNotFoundError, InvalidStateError if the
  //         status is not Captured, InvalidRefundAmountError if amount
  //         exceeds refundableAmount().
  // -------------------------------------------------------------------------
  void refund(const domain::TransactionId& id, double amount);

  // -------------------------------------------------------------------------
  // get(id)
  // -------------------------------------------------------------------------
  // @brief  Returns a snapshot of the current record.
  //
  // @throws TransactionNotFoundError.
  // -------------------------------------------------------------------------
  domain::Transaction get(const domain::TransactionId& id) const;

  // -------------------------------------------------------------------------
  // isPermitted(status, action)
  // -------------------------------------------------------------------------
  // @brief  Whether action may be applied to a transaction in status.
  //
  // @details
  // Legal combinations:
  //   Created    → Authorize
  //   Authorized → Capture
  //   Captured   → Refund
  //   Refunded   → (none — terminal)
  //
  // Pure function, no side effects.
  // -------------------------------------------------------------------------
  static bool isPermitted(domain::TransactionStatus status,
                          domain::TransactionAction action);

  // True only for Refunded.
  static bool isTerminal(domain::TransactionStatus status);

 private:
  // Loads the record or throws TransactionNotFoundError.
  domain::Transaction load(const domain::TransactionId& id) const;

  // Throws InvalidStateError (after logging) when isPermitted() is false.
  void requirePermitted(const domain::Transaction& transaction,
                        domain::TransactionAction action) const;

  void logTransition(const domain::Transaction& transaction,
                     domain::TransactionStatus previous) const;

  ITransactionStore& store_;
  TransactionIdGenerator& id_gen_;
  bool log_transitions_;
};

}  // namespace payflow
