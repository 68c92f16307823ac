#pragma once

#include "payflow/domain/transaction.hpp"

#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace payflow {

// -----------------------------------------------------------------------------
// TransactionIdGenerator — source of unique opaque transaction ids
// -----------------------------------------------------------------------------
//
// @brief  Produces ids of the form "<prefix>-<uuid v4>", e.g.
//         "txn-3f2b8c1e-9a4d-4e7f-b1c2-5d6e7f8a9b0c". With an empty prefix
//         the bare UUID is returned.
//
// @details
// The 122 random bits of a version-4 UUID come from a std::mt19937_64
// seeded once from std::random_device. Ids are opaque to every other
// component; nothing parses them.
//
// Why not a singleton:
//   The generator is owned as a value member by PaymentEngine and injected
//   into TransactionService by reference, so tests can construct their own.
//
// Thread model:
//   next_id() is safe to call concurrently from any thread (the engine
//   state is guarded by a mutex).
// -----------------------------------------------------------------------------
class TransactionIdGenerator {
 public:
  explicit TransactionIdGenerator(std::string prefix = "txn");

  // Non-copyable, non-movable: two copies would replay the same sequence.
  TransactionIdGenerator(const TransactionIdGenerator&) = delete;
  TransactionIdGenerator& operator=(const TransactionIdGenerator&) = delete;
  TransactionIdGenerator(TransactionIdGenerator&&) = delete;
  TransactionIdGenerator& operator=(TransactionIdGenerator&&) = delete;

  // -------------------------------------------------------------------------
  // next_id()
  // -------------------------------------------------------------------------
  // @brief  Returns a fresh id. Never returns an empty string.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  Advances the internal random engine.
  // -------------------------------------------------------------------------
  domain::TransactionId next_id();

  const std::string& prefix() const { return prefix_; }

 private:
  std::string prefix_;
  std::mutex mutex_;
  std::mt19937_64 engine_;
};

}  // namespace payflow
