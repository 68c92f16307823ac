// -----------------------------------------------------------------------------
// payflow — single executable entry point.
//
// Line-oriented command loop over the payment lifecycle engine:
//   1) Load EngineConfig from the optional first argument (JSON file).
//   2) Create the PaymentEngine (owns store, id generator and service).
//   3) Read one command per line from stdin, write one JSON response per
//      line to stdout. Diagnostics go to stderr.
//   4) Exit on EOF or QUIT (any case, surrounding whitespace ignored).
//
// Example session:
//   CREATE u1 100      → {"status":"ok","transaction":{"id":"txn-...",...}}
//   AUTHORIZE txn-...
//   CAPTURE txn-...
//   REFUND txn-... 30
//
// No global state; the engine is stack-local in main().
// -----------------------------------------------------------------------------

#include "payflow/config/engine_config.hpp"
#include "payflow/engine/payment_engine.hpp"
#include "payflow/errors/transaction_errors.hpp"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
  // -------------------------------------------------------------------------
  // 1) Configuration. A missing or malformed file is fatal.
  // -------------------------------------------------------------------------
  payflow::EngineConfig config;
  if (argc > 1) {
    try {
      config = payflow::loadEngineConfig(argv[1]);
    } catch (const payflow::ConfigError& e) {
      std::cerr << "[main] ERROR: " << e.what() << "\n";
      return 1;
    }
  }

  // -------------------------------------------------------------------------
  // 2) Engine.
  // -------------------------------------------------------------------------
  payflow::PaymentEngine engine(config);

  std::cerr << "[main] payflow ready (id_prefix='" << config.id_prefix
            << "'). Commands: CREATE, AUTHORIZE, CAPTURE, REFUND, GET, PING, "
               "QUIT.\n";

  // -------------------------------------------------------------------------
  // 3) Command loop.
  // -------------------------------------------------------------------------
  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }
    if (payflow::PaymentEngine::isQuitCommand(line)) {
      break;
    }
    std::cout << engine.executeCommand(line) << std::endl;
  }

  std::cerr << "[main] " << engine.store().size()
            << " transaction(s) processed. Exiting.\n";
  return 0;
}
