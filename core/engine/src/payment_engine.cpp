#include "payflow/engine/payment_engine.hpp"
#include "payflow/errors/transaction_errors.hpp"
#include "payflow/format/transaction_json.hpp"
#include "payflow/store/in_memory_transaction_store.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace payflow {

namespace {

std::unique_ptr<ITransactionStore> requireStore(
    std::unique_ptr<ITransactionStore> store) {
  if (!store) {
    throw std::invalid_argument("PaymentEngine requires a non-null store");
  }
  return store;
}

std::vector<std::string> tokenize(const std::string& cmd) {
  std::istringstream in(cmd);
  std::vector<std::string> tokens;
  std::string token;
  while (in >> token) {
    tokens.push_back(std::move(token));
  }
  return tokens;
}

std::string toUpper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return s;
}

// Accepts well-formed UTF-8 only: no overlong forms, surrogates or code
// points above U+10FFFF.
bool isValidUtf8(const std::string& s) {
  std::size_t i = 0;
  const std::size_t n = s.size();
  while (i < n) {
    const auto c = static_cast<unsigned char>(s[i]);
    std::size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (c < 0x80) {
      ++i;
      continue;
    }
    if (c >= 0xC2 && c <= 0xDF) {
      len = 1;
    } else if (c >= 0xE0 && c <= 0xEF) {
      len = 2;
      if (c == 0xE0) lo = 0xA0;
      if (c == 0xED) hi = 0x9F;
    } else if (c >= 0xF0 && c <= 0xF4) {
      len = 3;
      if (c == 0xF0) lo = 0x90;
      if (c == 0xF4) hi = 0x8F;
    } else {
      return false;
    }
    if (i + len >= n) {
      return false;
    }
    for (std::size_t k = 1; k <= len; ++k) {
      const auto cc = static_cast<unsigned char>(s[i + k]);
      if (cc < lo || cc > hi) {
        return false;
      }
      lo = 0x80;
      hi = 0xBF;
    }
    i += len + 1;
  }
  return true;
}

// Every response goes through here; invalid bytes become U+FFFD instead of
// raising json::type_error.
std::string serialize(const nlohmann::json& response) {
  return response.dump(-1, ' ', false,
                       nlohmann::json::error_handler_t::replace);
}

nlohmann::json errorResponse(const std::string& kind,
                             const std::string& message) {
  nlohmann::json response;
  response["status"] = "error";
  response["error"] = kind;
  response["message"] = message;
  return response;
}

nlohmann::json okResponse(const domain::Transaction& transaction) {
  nlohmann::json response;
  response["status"] = "ok";
  response["transaction"] = toJson(transaction);
  return response;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructors
// -----------------------------------------------------------------------------
PaymentEngine::PaymentEngine(EngineConfig config)
    : PaymentEngine(std::move(config),
                    std::make_unique<InMemoryTransactionStore>()) {}

PaymentEngine::PaymentEngine(EngineConfig config,
                             std::unique_ptr<ITransactionStore> store)
    : config_(std::move(config)),
      store_(requireStore(std::move(store))),
      id_gen_(config_.id_prefix),
      service_(*store_, id_gen_, config_.log_transitions) {}

// -----------------------------------------------------------------------------
// parseAmount(): whole token must be a finite number
// -----------------------------------------------------------------------------
std::optional<double> PaymentEngine::parseAmount(const std::string& token) {
  double value = 0.0;
  std::size_t consumed = 0;
  try {
    value = std::stod(token, &consumed);
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }

  if (consumed != token.size() || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

// -----------------------------------------------------------------------------
// isQuitCommand()
// -----------------------------------------------------------------------------
bool PaymentEngine::isQuitCommand(const std::string& line) {
  const std::vector<std::string> tokens = tokenize(line);
  return !tokens.empty() && toUpper(tokens[0]) == "QUIT";
}

// -----------------------------------------------------------------------------
// executeCommand(): dispatch one command line to the lifecycle service
// -----------------------------------------------------------------------------
std::string PaymentEngine::executeCommand(const std::string& cmd) {
  const std::vector<std::string> tokens = tokenize(cmd);
  if (tokens.empty()) {
    return serialize(errorResponse("bad_command", "Empty command"));
  }
  if (!isValidUtf8(cmd)) {
    std::cerr << "[PaymentEngine] WARNING: command is not valid UTF-8.\n";
    return serialize(
        errorResponse("bad_command", "Command is not valid UTF-8"));
  }

  const std::string verb = toUpper(tokens[0]);
  const std::size_t argc = tokens.size() - 1;

  auto usage = [&verb](const char* form) {
    return serialize(errorResponse("bad_command",
                                   "Usage: " + verb + " " + std::string(form)));
  };

  try {
    if (verb == "PING") {
      nlohmann::json response;
      response["status"] = "ok";
      response["response"] = "PONG";
      return serialize(response);
    }

    if (verb == "CREATE") {
      if (argc != 2) {
        return usage("<owner> <amount>");
      }
      auto amount = parseAmount(tokens[2]);
      if (!amount) {
        return serialize(
            errorResponse("bad_command", "Invalid amount: " + tokens[2]));
      }
      return serialize(okResponse(service_.create(tokens[1], *amount)));
    }

    if (verb == "AUTHORIZE" || verb == "CAPTURE" || verb == "GET") {
      if (argc != 1) {
        return usage("<id>");
      }
      const std::string& id = tokens[1];
      if (verb == "AUTHORIZE") {
        service_.authorize(id);
      } else if (verb == "CAPTURE") {
        service_.capture(id);
      }
      return serialize(okResponse(service_.get(id)));
    }

    if (verb == "REFUND") {
      if (argc != 2) {
        return usage("<id> <amount>");
      }
      auto amount = parseAmount(tokens[2]);
      if (!amount) {
        return serialize(
            errorResponse("bad_command", "Invalid amount: " + tokens[2]));
      }
      service_.refund(tokens[1], *amount);
      return serialize(okResponse(service_.get(tokens[1])));
    }
  } catch (const InvalidArgumentError& e) {
    return serialize(errorResponse("invalid_argument", e.what()));
  } catch (const TransactionNotFoundError& e) {
    nlohmann::json response = errorResponse("not_found", e.what());
    response["transaction_id"] = e.transactionId();
    return serialize(response);
  } catch (const InvalidStateError& e) {
    nlohmann::json response = errorResponse("invalid_state", e.what());
    response["transaction_id"] = e.transactionId();
    response["current_status"] = statusToString(e.currentStatus());
    response["action"] = actionToString(e.attemptedAction());
    return serialize(response);
  } catch (const InvalidRefundAmountError& e) {
    nlohmann::json response = errorResponse("invalid_refund_amount", e.what());
    response["transaction_id"] = e.transactionId();
    response["requested"] = e.requestedAmount();
    response["available"] = e.availableAmount();
    return serialize(response);
  }

  std::cerr << "[PaymentEngine] WARNING: unknown command '" << tokens[0]
            << "'.\n";
  return serialize(
      errorResponse("bad_command", "Unknown command: " + tokens[0]));
}

}  // namespace payflow
