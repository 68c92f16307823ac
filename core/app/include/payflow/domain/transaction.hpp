#pragma once

#include "payflow/domain/transaction_status.hpp"

#include <string>

namespace payflow {
namespace domain {

// -----------------------------------------------------------------------------
// TransactionId
// -----------------------------------------------------------------------------
// Responsibility: Opaque identifier of a transaction, assigned once at
// creation by TransactionIdGenerator and never changed afterwards.
// Why a string alias: ids are generated as "<prefix>-<uuid>" and travel
// through the command layer as text; the alias keeps signatures readable.
// -----------------------------------------------------------------------------
using TransactionId = std::string;

// -----------------------------------------------------------------------------
// Transaction
// -----------------------------------------------------------------------------
// Responsibility: Full state of one payment transaction: the immutable
// intent (id, owner, captured amount) plus its lifecycle status and the
// running refund total.
//
// @details
// Built by TransactionService::create() with status Created and
// refunded_amount 0. Only the service changes status and refunded_amount,
// and it always writes the changed copy back through ITransactionStore.
//
// Invariant: 0 <= refunded_amount <= captured_amount.
//
// Value semantics: the store owns the authoritative copy; everything handed
// out (get(), create(), command responses) is a snapshot.
// -----------------------------------------------------------------------------
struct Transaction {
  TransactionId id;                  // Unique id, immutable
  std::string owner_id;              // Paying party, immutable
  double captured_amount{0.0};       // Amount charged; ceiling for refunds
  double refunded_amount{0.0};       // Running total of accepted refunds
  TransactionStatus status{TransactionStatus::Created};

  // Amount still available for the next refund request.
  double refundableAmount() const { return captured_amount - refunded_amount; }
};

}  // namespace domain
}  // namespace payflow
