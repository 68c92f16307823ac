#pragma once

#include "payflow/concurrent/transaction_id_generator.hpp"
#include "payflow/config/engine_config.hpp"
#include "payflow/service/transaction_service.hpp"
#include "payflow/store/i_transaction_store.hpp"

#include <memory>
#include <optional>
#include <string>

namespace payflow {

// -----------------------------------------------------------------------------
// PaymentEngine
// -----------------------------------------------------------------------------
//
// @brief  Programmatic root: owns the store, the id generator and the
//         lifecycle service, and exposes a textual command interface on top
//         of them.
//
// @details
// No global mutable state — every collaborator is a member, constructed once
// here and handed to TransactionService by reference.
//
// Command interface (executeCommand):
//
//   PING                      → {"status":"ok","response":"PONG"}
//   CREATE <owner> <amount>   → {"status":"ok","transaction":{...}}
//   AUTHORIZE <id>            → {"status":"ok","transaction":{...}}
//   CAPTURE <id>              → {"status":"ok","transaction":{...}}
//   REFUND <id> <amount>      → {"status":"ok","transaction":{...}}
//   GET <id>                  → {"status":"ok","transaction":{...}}
//
// Verbs are case-insensitive. Every TransactionError is converted into
//   {"status":"error","error":<kind>,"message":<what()>}
// with kind one of invalid_argument, not_found, invalid_state,
// invalid_refund_amount. Malformed input yields kind bad_command.
//
// Ownership:
//   PaymentEngine
//    ├── config_    (EngineConfig — value member)
//    ├── store_     (unique_ptr<ITransactionStore>, in-memory by default)
//    ├── id_gen_    (TransactionIdGenerator — value member, non-movable)
//    └── service_   (TransactionService — refers to store_ and id_gen_)
//
// Members are declared in dependency order so the service is destroyed
// before the store and generator it references.
//
// Thread model:
//   Single-threaded. Call from one thread only.
// -----------------------------------------------------------------------------
class PaymentEngine {
 public:
  // Uses an InMemoryTransactionStore.
  explicit PaymentEngine(EngineConfig config = EngineConfig{});

  // -------------------------------------------------------------------------
  // Constructor (custom store)
  // -------------------------------------------------------------------------
  // @param  config  Engine settings.
  // @param  store   Any ITransactionStore implementation. Must not be null.
  //
  // @throws std::invalid_argument if store is null.
  // -------------------------------------------------------------------------
  PaymentEngine(EngineConfig config, std::unique_ptr<ITransactionStore> store);

  PaymentEngine(const PaymentEngine&) = delete;
  PaymentEngine& operator=(const PaymentEngine&) = delete;
  PaymentEngine(PaymentEngine&&) = delete;
  PaymentEngine& operator=(PaymentEngine&&) = delete;

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Parses one command line, runs it against the service and
  //         returns the JSON response text.
  //
  // @details
  // Never throws for business-rule failures or malformed input; those are
  // reported in the response. A line that is not valid UTF-8 is rejected as
  // bad_command before it reaches the service. The store is left untouched
  // by every failed command.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // True when the first token of the line is QUIT, in any case.
  static bool isQuitCommand(const std::string& line);

  TransactionService& service() { return service_; }
  const ITransactionStore& store() const { return *store_; }
  const EngineConfig& config() const { return config_; }

 private:
  // Parses a finite decimal amount; nullopt when the token is not one.
  static std::optional<double> parseAmount(const std::string& token);

  EngineConfig config_;
  std::unique_ptr<ITransactionStore> store_;
  TransactionIdGenerator id_gen_;
  TransactionService service_;
};

}  // namespace payflow
