#include "payflow/service/transaction_service.hpp"
#include "payflow/errors/transaction_errors.hpp"
#include "payflow/format/transaction_json.hpp"

#include <iostream>

namespace payflow {

// -----------------------------------------------------------------------------
// Constructor: bind store and id generator
// -----------------------------------------------------------------------------
TransactionService::TransactionService(ITransactionStore& store,
                                       TransactionIdGenerator& id_gen,
                                       bool log_transitions)
    : store_(store), id_gen_(id_gen), log_transitions_(log_transitions) {}

// -----------------------------------------------------------------------------
// isPermitted: validate (status, action) against the lifecycle graph
// -----------------------------------------------------------------------------
bool TransactionService::isPermitted(domain::TransactionStatus status,
                                     domain::TransactionAction action) {
  using S = domain::TransactionStatus;
  using A = domain::TransactionAction;

  switch (status) {
    case S::Created:
      return action == A::Authorize;

    case S::Authorized:
      return action == A::Capture;

    case S::Captured:
      return action == A::Refund;

    case S::Refunded:
      return false;
  }

  return false;
}

// -----------------------------------------------------------------------------
// isTerminal: no outgoing transitions
// -----------------------------------------------------------------------------
bool TransactionService::isTerminal(domain::TransactionStatus status) {
  return status == domain::TransactionStatus::Refunded;
}

// -----------------------------------------------------------------------------
// create: validate, assign id, persist in Created
// -----------------------------------------------------------------------------
domain::Transaction TransactionService::create(const std::string& owner_id,
                                               double amount) {
  if (owner_id.empty()) {
    std::cerr << "[TransactionService] WARNING: create rejected, empty "
                 "owner_id.\n";
    throw InvalidArgumentError("owner_id cannot be empty");
  }
  // Written as !(amount > 0) so NaN is rejected too.
  if (!(amount > 0.0)) {
    std::cerr << "[TransactionService] WARNING: create rejected, amount="
              << amount << " is not positive.\n";
    throw InvalidArgumentError("amount must be positive");
  }

  domain::Transaction transaction;
  transaction.id = id_gen_.next_id();
  transaction.owner_id = owner_id;
  transaction.captured_amount = amount;
  transaction.refunded_amount = 0.0;
  transaction.status = domain::TransactionStatus::Created;

  store_.save(transaction);

  if (log_transitions_) {
    std::cout << "[TransactionService] created id=" << transaction.id
              << " owner=" << transaction.owner_id
              << " amount=" << transaction.captured_amount << "\n";
  }

  return transaction;
}

// -----------------------------------------------------------------------------
// authorize: Created -> Authorized
// -----------------------------------------------------------------------------
void TransactionService::authorize(const domain::TransactionId& id) {
  domain::Transaction transaction = load(id);
  requirePermitted(transaction, domain::TransactionAction::Authorize);

  const domain::TransactionStatus previous = transaction.status;
  transaction.status = domain::TransactionStatus::Authorized;
  store_.save(transaction);

  logTransition(transaction, previous);
}

// -----------------------------------------------------------------------------
// capture: Authorized -> Captured
// -----------------------------------------------------------------------------
void TransactionService::capture(const domain::TransactionId& id) {
  domain::Transaction transaction = load(id);
  requirePermitted(transaction, domain::TransactionAction::Capture);

  const domain::TransactionStatus previous = transaction.status;
  transaction.status = domain::TransactionStatus::Captured;
  store_.save(transaction);

  logTransition(transaction, previous);
}

// -----------------------------------------------------------------------------
// refund: accumulate, then derive Captured / Refunded from the running total
// -----------------------------------------------------------------------------
void TransactionService::refund(const domain::TransactionId& id,
                                double amount) {
  if (!(amount > 0.0)) {
    std::cerr << "[TransactionService] WARNING: refund rejected for id=" << id
              << ", amount=" << amount << " is not positive.\n";
    throw InvalidArgumentError("refund amount must be positive");
  }

  domain::Transaction transaction = load(id);
  requirePermitted(transaction, domain::TransactionAction::Refund);

  const double available = transaction.refundableAmount();
  if (amount > available) {
    std::cerr << "[TransactionService] WARNING: refund of " << amount
              << " exceeds refundable " << available << " for id=" << id
              << ". Rejecting.\n";
    throw InvalidRefundAmountError(id, amount, available);
  }

  const domain::TransactionStatus previous = transaction.status;
  transaction.refunded_amount += amount;

  // >= rather than == so floating-point drift on the last partial refund
  // still reaches the terminal state.
  if (transaction.refunded_amount >= transaction.captured_amount) {
    transaction.status = domain::TransactionStatus::Refunded;
  }

  store_.save(transaction);

  logTransition(transaction, previous);
}

// -----------------------------------------------------------------------------
// get: snapshot of the current record
// -----------------------------------------------------------------------------
domain::Transaction TransactionService::get(
    const domain::TransactionId& id) const {
  return load(id);
}

// -----------------------------------------------------------------------------
// load: findById or throw TransactionNotFoundError
// -----------------------------------------------------------------------------
domain::Transaction TransactionService::load(
    const domain::TransactionId& id) const {
  auto found = store_.findById(id);
  if (!found.has_value()) {
    std::cerr << "[TransactionService] WARNING: unknown transaction id=" << id
              << ".\n";
    throw TransactionNotFoundError(id);
  }
  return *found;
}

// -----------------------------------------------------------------------------
// requirePermitted: reject illegal actions before any mutation
// -----------------------------------------------------------------------------
void TransactionService::requirePermitted(
    const domain::Transaction& transaction,
    domain::TransactionAction action) const {
  if (isPermitted(transaction.status, action)) {
    return;
  }

  std::cerr << "[TransactionService] WARNING: illegal "
            << actionToString(action) << " for id=" << transaction.id
            << " in status " << statusToString(transaction.status)
            << ". Rejecting.\n";
  throw InvalidStateError(transaction.id, transaction.status, action);
}

// -----------------------------------------------------------------------------
// logTransition
// -----------------------------------------------------------------------------
void TransactionService::logTransition(
    const domain::Transaction& transaction,
    domain::TransactionStatus previous) const {
  if (!log_transitions_) {
    return;
  }

  std::cout << "[TransactionService] id=" << transaction.id << " "
            << statusToString(previous) << " -> "
            << statusToString(transaction.status)
            << " refunded=" << transaction.refunded_amount
            << " refundable=" << transaction.refundableAmount()
            << (isTerminal(transaction.status) ? " (terminal)" : "") << "\n";
}

}  // namespace payflow
