#include "payflow/errors/transaction_errors.hpp"
#include "payflow/format/transaction_json.hpp"

#include <sstream>
#include <utility>

namespace payflow {

namespace {

std::string notFoundMessage(const domain::TransactionId& id) {
  return "Transaction not found: " + id;
}

std::string invalidStateMessage(const domain::TransactionId& id,
                                domain::TransactionStatus status,
                                domain::TransactionAction action) {
  std::ostringstream out;
  out << "Cannot " << actionToString(action) << " transaction " << id
      << " in status " << statusToString(status);
  return out.str();
}

std::string invalidRefundMessage(const domain::TransactionId& id,
                                 double requested, double available) {
  std::ostringstream out;
  out << "Cannot refund " << requested << " for transaction " << id
      << ". Available for refund: " << available;
  return out.str();
}

}  // namespace

TransactionNotFoundError::TransactionNotFoundError(
    domain::TransactionId transaction_id)
    : TransactionError(notFoundMessage(transaction_id)),
      transaction_id_(std::move(transaction_id)) {}

InvalidStateError::InvalidStateError(domain::TransactionId transaction_id,
                                     domain::TransactionStatus current_status,
                                     domain::TransactionAction attempted_action)
    : TransactionError(invalidStateMessage(transaction_id, current_status,
                                           attempted_action)),
      transaction_id_(std::move(transaction_id)),
      current_status_(current_status),
      attempted_action_(attempted_action) {}

InvalidRefundAmountError::InvalidRefundAmountError(
    domain::TransactionId transaction_id, double requested_amount,
    double available_amount)
    : TransactionError(invalidRefundMessage(transaction_id, requested_amount,
                                            available_amount)),
      transaction_id_(std::move(transaction_id)),
      requested_amount_(requested_amount),
      available_amount_(available_amount) {}

}  // namespace payflow
