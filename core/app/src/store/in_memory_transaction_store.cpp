#include "payflow/store/in_memory_transaction_store.hpp"

namespace payflow {

// -----------------------------------------------------------------------------
// save: upsert by id
// -----------------------------------------------------------------------------
void InMemoryTransactionStore::save(const domain::Transaction& transaction) {
  records_[transaction.id] = transaction;
}

// -----------------------------------------------------------------------------
// findById: copy out, or nullopt when absent
// -----------------------------------------------------------------------------
std::optional<domain::Transaction> InMemoryTransactionStore::findById(
    const domain::TransactionId& id) const {
  auto it = records_.find(id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool InMemoryTransactionStore::exists(const domain::TransactionId& id) const {
  return records_.count(id) != 0;
}

std::size_t InMemoryTransactionStore::size() const { return records_.size(); }

}  // namespace payflow
