#pragma once

#include "payflow/domain/transaction.hpp"
#include "payflow/domain/transaction_status.hpp"

#include <nlohmann/json.hpp>

namespace payflow {

// -----------------------------------------------------------------------------
// Transaction formatting
// -----------------------------------------------------------------------------
//
// @brief  Free functions that render domain values for humans and for the
//         JSON command responses.
//
// @details
// The JSON view of a transaction includes the derived refundable_amount so
// callers never recompute it:
//
//   {"id": "...", "owner_id": "...", "captured_amount": 100.0,
//    "refunded_amount": 30.0, "refundable_amount": 70.0,
//    "status": "CAPTURED"}
//
// Thread-safety: Stateless — safe to call from any thread.
// -----------------------------------------------------------------------------

// "CREATED", "AUTHORIZED", "CAPTURED", "REFUNDED".
const char* statusToString(domain::TransactionStatus status);

// "authorize", "capture", "refund" (used inside error messages).
const char* actionToString(domain::TransactionAction action);

nlohmann::json toJson(const domain::Transaction& transaction);

}  // namespace payflow
