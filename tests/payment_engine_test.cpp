// =============================================================================
// payment_engine_test.cpp
// =============================================================================
// Unit tests for payflow::PaymentEngine and its textual command interface.
//
// Validates:
//   - PING and the full CREATE → AUTHORIZE → CAPTURE → REFUND → GET flow
//   - Each TransactionError kind maps to its JSON error response
//   - Malformed commands, including invalid UTF-8, answer bad_command and
//     leave the store untouched
//   - EngineConfig reaches the id generator
//   - A caller-supplied store is used as-is
//
// Design: Responses are parsed back with nlohmann::json so assertions do not
// depend on key order or number formatting.
// =============================================================================

#include "payflow/engine/payment_engine.hpp"
#include "payflow/store/in_memory_transaction_store.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <stdexcept>
#include <string>

class PaymentEngineTest : public ::testing::Test {
 protected:
  payflow::PaymentEngine engine;

  nlohmann::json run(const std::string& cmd) {
    return nlohmann::json::parse(engine.executeCommand(cmd));
  }

  // CREATE → AUTHORIZE → CAPTURE, return the id.
  std::string captured(const std::string& owner, double amount) {
    auto created = run("CREATE " + owner + " " + std::to_string(amount));
    std::string id = created["transaction"]["id"].get<std::string>();
    run("AUTHORIZE " + id);
    run("CAPTURE " + id);
    return id;
  }
};

// -----------------------------------------------------------------------------
// 1. PING answers PONG.
// -----------------------------------------------------------------------------
TEST_F(PaymentEngineTest, PingReturnsPong) {
  auto r = run("PING");
  EXPECT_EQ(r["status"].get<std::string>(), "ok");
  EXPECT_EQ(r["response"].get<std::string>(), "PONG");
}

// -----------------------------------------------------------------------------
// 2. CREATE returns the full transaction view.
// -----------------------------------------------------------------------------
TEST_F(PaymentEngineTest, CreateReturnsTransactionView) {
  auto r = run("CREATE u1 100");

  ASSERT_EQ(r["status"].get<std::string>(), "ok");
  const auto& t = r["transaction"];
  EXPECT_EQ(t["owner_id"].get<std::string>(), "u1");
  EXPECT_EQ(t["status"].get<std::string>(), "CREATED");
  EXPECT_DOUBLE_EQ(t["captured_amount"].get<double>(), 100.0);
  EXPECT_DOUBLE_EQ(t["refunded_amount"].get<double>(), 0.0);
  EXPECT_DOUBLE_EQ(t["refundable_amount"].get<double>(), 100.0);
  EXPECT_EQ(t["id"].get<std::string>().rfind("txn-", 0), 0u);
  EXPECT_EQ(engine.store().size(), 1u);
}

// -----------------------------------------------------------------------------
// 3. Scenario through the command layer: refund 30, refund 70, refund 1.
// -----------------------------------------------------------------------------
TEST_F(PaymentEngineTest, RefundScenarioThroughCommands) {
  std::string id = captured("u1", 100.0);

  auto r = run("REFUND " + id + " 30");
  ASSERT_EQ(r["status"].get<std::string>(), "ok");
  EXPECT_EQ(r["transaction"]["status"].get<std::string>(), "CAPTURED");
  EXPECT_DOUBLE_EQ(r["transaction"]["refunded_amount"].get<double>(), 30.0);
  EXPECT_DOUBLE_EQ(r["transaction"]["refundable_amount"].get<double>(), 70.0);

  r = run("REFUND " + id + " 70");
  ASSERT_EQ(r["status"].get<std::string>(), "ok");
  EXPECT_EQ(r["transaction"]["status"].get<std::string>(), "REFUNDED");
  EXPECT_DOUBLE_EQ(r["transaction"]["refundable_amount"].get<double>(), 0.0);

  r = run("REFUND " + id + " 1");
  EXPECT_EQ(r["status"].get<std::string>(), "error");
  EXPECT_EQ(r["error"].get<std::string>(), "invalid_state");
  EXPECT_EQ(r["current_status"].get<std::string>(), "REFUNDED");
  EXPECT_EQ(r["action"].get<std::string>(), "refund");
  EXPECT_EQ(r["transaction_id"].get<std::string>(), id);
}

// -----------------------------------------------------------------------------
// 4. Verbs are case-insensitive; GET shows the current record.
// -----------------------------------------------------------------------------
TEST_F(PaymentEngineTest, VerbsAreCaseInsensitive) {
  auto created = run("create u9 20");
  std::string id = created["transaction"]["id"].get<std::string>();

  auto authorized = run("Authorize " + id);
  EXPECT_EQ(authorized["transaction"]["status"].get<std::string>(),
            "AUTHORIZED");

  auto fetched = run("get " + id);
  EXPECT_EQ(fetched["transaction"]["status"].get<std::string>(), "AUTHORIZED");
}

// -----------------------------------------------------------------------------
// 5. A well-formed but non-positive amount is rejected by the service and
//    reported as invalid_argument.
// -----------------------------------------------------------------------------
TEST_F(PaymentEngineTest, NonPositiveAmountIsInvalidArgument) {
  auto r = run("CREATE u2 0");
  EXPECT_EQ(r["status"].get<std::string>(), "error");
  EXPECT_EQ(r["error"].get<std::string>(), "invalid_argument");

  r = run("CREATE u2 -5");
  EXPECT_EQ(r["error"].get<std::string>(), "invalid_argument");

  EXPECT_EQ(engine.store().size(), 0u);
}

// -----------------------------------------------------------------------------
// 6. Unknown ids map to not_found for every id-taking command.
// -----------------------------------------------------------------------------
TEST_F(PaymentEngineTest, UnknownIdIsNotFound) {
  for (const char* cmd : {"AUTHORIZE nope", "CAPTURE nope", "GET nope",
                          "REFUND nope 5"}) {
    auto r = run(cmd);
    EXPECT_EQ(r["status"].get<std::string>(), "error") << cmd;
    EXPECT_EQ(r["error"].get<std::string>(), "not_found") << cmd;
    EXPECT_EQ(r["transaction_id"].get<std::string>(), "nope") << cmd;
  }
  EXPECT_EQ(engine.store().size(), 0u);
}

// -----------------------------------------------------------------------------
// 7. Over-refund maps to invalid_refund_amount with both figures.
// -----------------------------------------------------------------------------
TEST_F(PaymentEngineTest, OverRefundReportsFigures) {
  std::string id = captured("u3", 75.0);

  auto r = run("REFUND " + id + " 100");
  EXPECT_EQ(r["status"].get<std::string>(), "error");
  EXPECT_EQ(r["error"].get<std::string>(), "invalid_refund_amount");
  EXPECT_DOUBLE_EQ(r["requested"].get<double>(), 100.0);
  EXPECT_DOUBLE_EQ(r["available"].get<double>(), 75.0);

  auto g = run("GET " + id);
  EXPECT_EQ(g["transaction"]["status"].get<std::string>(), "CAPTURED");
  EXPECT_DOUBLE_EQ(g["transaction"]["refunded_amount"].get<double>(), 0.0);
}

// -----------------------------------------------------------------------------
// 8. Capture before authorize maps to invalid_state.
// -----------------------------------------------------------------------------
TEST_F(PaymentEngineTest, CaptureBeforeAuthorizeIsInvalidState) {
  auto created = run("CREATE u4 30");
  std::string id = created["transaction"]["id"].get<std::string>();

  auto r = run("CAPTURE " + id);
  EXPECT_EQ(r["error"].get<std::string>(), "invalid_state");
  EXPECT_EQ(r["current_status"].get<std::string>(), "CREATED");
  EXPECT_EQ(r["action"].get<std::string>(), "capture");
}

// -----------------------------------------------------------------------------
// 9. Malformed input answers bad_command.
// -----------------------------------------------------------------------------
TEST_F(PaymentEngineTest, MalformedCommandsAreBadCommand) {
  for (const char* cmd : {"", "   ", "FROBNICATE x", "CREATE u1",
                          "CREATE u1 abc", "CREATE u1 10x", "CREATE u1 nan",
                          "CREATE u1 inf", "AUTHORIZE", "AUTHORIZE a b",
                          "REFUND a", "REFUND a ten"}) {
    auto r = run(cmd);
    EXPECT_EQ(r["status"].get<std::string>(), "error") << "'" << cmd << "'";
    EXPECT_EQ(r["error"].get<std::string>(), "bad_command")
        << "'" << cmd << "'";
  }
  EXPECT_EQ(engine.store().size(), 0u);
}

// -----------------------------------------------------------------------------
// 10. Bytes that are not valid UTF-8 answer bad_command without throwing,
//     and CREATE writes nothing.
// -----------------------------------------------------------------------------
TEST_F(PaymentEngineTest, InvalidUtf8IsBadCommandWithoutMutation) {
  for (const std::string cmd :
       {std::string("CREATE \xff\xfe 10"), std::string("FROB\xff"),
        std::string("GET \xc3"), std::string("REFUND \xed\xa0\x80 5"),
        std::string("CREATE u\xc0\xaf 10")}) {
    std::string text;
    ASSERT_NO_THROW(text = engine.executeCommand(cmd));
    auto r = nlohmann::json::parse(text);
    EXPECT_EQ(r["status"].get<std::string>(), "error");
    EXPECT_EQ(r["error"].get<std::string>(), "bad_command");
  }
  EXPECT_EQ(engine.store().size(), 0u);

  // Well-formed multi-byte owner ids still work.
  auto ok = run("CREATE \xc3\xa9l\xc3\xa8ve 10");
  ASSERT_EQ(ok["status"].get<std::string>(), "ok");
  EXPECT_EQ(ok["transaction"]["owner_id"].get<std::string>(),
            "\xc3\xa9l\xc3\xa8ve");
  EXPECT_EQ(engine.store().size(), 1u);
}

// -----------------------------------------------------------------------------
// 11. QUIT is recognized like any other verb: case-insensitive, surrounding
//     whitespace and a trailing CR ignored.
// -----------------------------------------------------------------------------
TEST(PaymentEngineQuitTest, QuitIsCaseAndWhitespaceInsensitive) {
  using payflow::PaymentEngine;
  for (const char* line : {"QUIT", "quit", "Quit", " QUIT", "\tquit  ",
                           "QUIT\r"}) {
    EXPECT_TRUE(PaymentEngine::isQuitCommand(line)) << "'" << line << "'";
  }
  for (const char* line : {"", "   ", "QUITX", "PING", "GET QUIT"}) {
    EXPECT_FALSE(PaymentEngine::isQuitCommand(line)) << "'" << line << "'";
  }
}

// -----------------------------------------------------------------------------
// 12. id_prefix from EngineConfig reaches generated ids.
// -----------------------------------------------------------------------------
TEST(PaymentEngineConfigTest, IdPrefixFromConfig) {
  payflow::EngineConfig config;
  config.id_prefix = "pay";
  payflow::PaymentEngine engine(config);

  auto r = nlohmann::json::parse(engine.executeCommand("CREATE u1 5"));
  EXPECT_EQ(r["transaction"]["id"].get<std::string>().rfind("pay-", 0), 0u);
  EXPECT_EQ(engine.config().id_prefix, "pay");
}

// -----------------------------------------------------------------------------
// 13. A caller-supplied store is the one the service writes to; a null store
//     is refused.
// -----------------------------------------------------------------------------
TEST(PaymentEngineConfigTest, CustomStoreIsUsed) {
  auto store = std::make_unique<payflow::InMemoryTransactionStore>();
  payflow::InMemoryTransactionStore* raw = store.get();

  payflow::PaymentEngine engine(payflow::EngineConfig{}, std::move(store));
  payflow::domain::Transaction t = engine.service().create("u1", 10.0);

  EXPECT_TRUE(raw->exists(t.id));
  EXPECT_EQ(&engine.store(), raw);

  EXPECT_THROW(payflow::PaymentEngine(payflow::EngineConfig{}, nullptr),
               std::invalid_argument);
}
