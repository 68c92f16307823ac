#include "payflow/format/transaction_json.hpp"

namespace payflow {

// -----------------------------------------------------------------------------
// statusToString()
// -----------------------------------------------------------------------------
const char* statusToString(domain::TransactionStatus status) {
  using S = domain::TransactionStatus;
  switch (status) {
    case S::Created:    return "CREATED";
    case S::Authorized: return "AUTHORIZED";
    case S::Captured:   return "CAPTURED";
    case S::Refunded:   return "REFUNDED";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// actionToString()
// -----------------------------------------------------------------------------
const char* actionToString(domain::TransactionAction action) {
  using A = domain::TransactionAction;
  switch (action) {
    case A::Authorize: return "authorize";
    case A::Capture:   return "capture";
    case A::Refund:    return "refund";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// toJson()
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::Transaction& transaction) {
  nlohmann::json j;
  j["id"] = transaction.id;
  j["owner_id"] = transaction.owner_id;
  j["captured_amount"] = transaction.captured_amount;
  j["refunded_amount"] = transaction.refunded_amount;
  j["refundable_amount"] = transaction.refundableAmount();
  j["status"] = statusToString(transaction.status);
  return j;
}

}  // namespace payflow
