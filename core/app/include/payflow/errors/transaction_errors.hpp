#pragma once

#include "payflow/domain/transaction.hpp"
#include "payflow/domain/transaction_status.hpp"

#include <stdexcept>
#include <string>

namespace payflow {

// -----------------------------------------------------------------------------
// TransactionError — base of every lifecycle rejection
// -----------------------------------------------------------------------------
//
// @brief  Common base so a calling layer can catch all business-rule
//         failures in one handler and still dispatch on the concrete type.
//
// @details
// Every error is raised synchronously, before any store write, and is never
// recovered inside the service. The concrete types carry the figures a
// caller needs for diagnostics; what() is a ready-made human message.
// -----------------------------------------------------------------------------
class TransactionError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Malformed input to create() or refund(): empty owner id, non-positive
// amount.
class InvalidArgumentError : public TransactionError {
 public:
  using TransactionError::TransactionError;
};

// -----------------------------------------------------------------------------
// TransactionNotFoundError — the referenced id has no record
// -----------------------------------------------------------------------------
class TransactionNotFoundError : public TransactionError {
 public:
  explicit TransactionNotFoundError(domain::TransactionId transaction_id);

  const domain::TransactionId& transactionId() const { return transaction_id_; }

 private:
  domain::TransactionId transaction_id_;
};

// -----------------------------------------------------------------------------
// InvalidStateError — operation not legal in the record's current status
// -----------------------------------------------------------------------------
// Message: "Cannot <action> transaction <id> in status <STATUS>".
// -----------------------------------------------------------------------------
class InvalidStateError : public TransactionError {
 public:
  InvalidStateError(domain::TransactionId transaction_id,
                    domain::TransactionStatus current_status,
                    domain::TransactionAction attempted_action);

  const domain::TransactionId& transactionId() const { return transaction_id_; }
  domain::TransactionStatus currentStatus() const { return current_status_; }
  domain::TransactionAction attemptedAction() const {
    return attempted_action_;
  }

 private:
  domain::TransactionId transaction_id_;
  domain::TransactionStatus current_status_;
  domain::TransactionAction attempted_action_;
};

// -----------------------------------------------------------------------------
// InvalidRefundAmountError — refund exceeds the current refundable balance
// -----------------------------------------------------------------------------
// Message: "Cannot refund <requested> for transaction <id>. Available for
// refund: <available>".
// -----------------------------------------------------------------------------
class InvalidRefundAmountError : public TransactionError {
 public:
  InvalidRefundAmountError(domain::TransactionId transaction_id,
                           double requested_amount, double available_amount);

  const domain::TransactionId& transactionId() const { return transaction_id_; }
  double requestedAmount() const { return requested_amount_; }
  double availableAmount() const { return available_amount_; }

 private:
  domain::TransactionId transaction_id_;
  double requested_amount_;
  double available_amount_;
};

// Configuration document missing, unparseable, or holding a wrong type.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace payflow
