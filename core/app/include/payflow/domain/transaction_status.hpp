#pragma once

namespace payflow {
namespace domain {

// -----------------------------------------------------------------------------
// TransactionStatus — payment transaction lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every state a payment transaction can occupy from
//         creation to full refund.
//
// @details
// The lifecycle is strictly linear up to capture, then loops on Captured
// while partial refunds accumulate:
//
//   Created ───> Authorized ───> Captured ──(refund, full)──> Refunded
//                                  │   ▲
//                                  └───┘
//                           (refund, partial)
//
// Terminal state: Refunded. No operation is defined on a Refunded
// transaction. There is deliberately no PartiallyRefunded state: a captured
// transaction with refunded_amount > 0 is still Captured.
//
// Legality of each operation is decided by TransactionService::isPermitted().
// -----------------------------------------------------------------------------
enum class TransactionStatus {
  Created,     // Built by the service, nothing charged yet
  Authorized,  // Funds reserved with the payer
  Captured,    // Funds charged; refunds allowed while refundable > 0
  Refunded,    // Fully refunded — terminal state
};

// -----------------------------------------------------------------------------
// TransactionAction — the mutating commands of the lifecycle service
// -----------------------------------------------------------------------------
// Used to check legality against the current status and to report the
// attempted action in InvalidStateError. Creation is not listed: it has no
// source state.
// -----------------------------------------------------------------------------
enum class TransactionAction {
  Authorize,
  Capture,
  Refund,
};

}  // namespace domain
}  // namespace payflow
