#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <nlohmann/json.hpp>

#include "LedgerTestFixture.hpp"
#include "adapters/primary/LedgerCommandHandler.hpp"
#include "mocks/MockPriceFeed.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>

using namespace ledger;
using namespace ledger::tests;
using adapters::primary::CommandArgs;
using adapters::primary::LedgerCommandHandler;
using json = nlohmann::json;
using ::testing::NiceMock;
using ::testing::Return;

// ============================================================================
// Тестовый класс LedgerCommandHandlerTest
// ============================================================================

class LedgerCommandHandlerTest : public LedgerTestFixture {
protected:
    void SetUp() override {
        LedgerTestFixture::SetUp();
        priceFeed_ = std::make_shared<NiceMock<MockPriceFeed>>();
        handler_ = std::make_unique<LedgerCommandHandler>(
            catalog_, rates_, holdings_, recorder_, portfolio_, registry_, priceFeed_);
    }

    // Выполнить команду, вернуть код возврата и разобранный JSON
    int run(const std::vector<std::string>& args, json& body) {
        std::ostringstream out;
        int code = handler_->handle(args, out);
        try {
            body = json::parse(out.str());
        } catch (const json::exception& e) {
            ADD_FAILURE() << "Failed to parse JSON: " << e.what() << "\nBody: " << out.str();
        }
        return code;
    }

    std::shared_ptr<NiceMock<MockPriceFeed>> priceFeed_;
    std::unique_ptr<LedgerCommandHandler> handler_;
};

// ============================================================================
// Разбор аргументов
// ============================================================================

TEST(CommandArgsTest, Parse_PositionalAndOptions) {
    auto args = CommandArgs::parse({"tx", "transfer", "A", "B", "--fee", "-0.1", "BTC", "--all"});
    std::vector<std::string> positional = {"tx", "transfer", "A", "B", "BTC"};
    EXPECT_EQ(args.positional, positional);
    EXPECT_EQ(args.option("fee"), std::optional<std::string>("-0.1"));
    EXPECT_TRUE(args.has("all"));
    EXPECT_EQ(args.option("all"), std::optional<std::string>(""));
    EXPECT_FALSE(args.option("rate").has_value());
}

// ============================================================================
// currency
// ============================================================================

TEST_F(LedgerCommandHandlerTest, CurrencyList_SeededOrder) {
    json body;
    ASSERT_EQ(run({"currency", "list"}, body), 0);
    ASSERT_TRUE(body.is_array());
    ASSERT_EQ(body.size(), 9u);
    EXPECT_EQ(body[0]["code"], "CRC");
    EXPECT_EQ(body[0]["asset_class"], "fiat");
    EXPECT_EQ(body[8]["code"], "SOL");
}

TEST_F(LedgerCommandHandlerTest, CurrencyAdd_ThenDuplicate) {
    json body;
    ASSERT_EQ(run({"currency", "add", "ada", "Cardano", "A", "6", "crypto"}, body), 0);
    EXPECT_EQ(body["code"], "ADA");
    EXPECT_EQ(body["decimals"], 6);

    ASSERT_EQ(run({"currency", "add", "ADA", "Cardano", "A", "6", "crypto"}, body), 1);
    EXPECT_EQ(body["error"], "ALREADY_EXISTS");
}

TEST_F(LedgerCommandHandlerTest, CurrencyAdd_UnknownClass_Usage) {
    json body;
    EXPECT_EQ(run({"currency", "add", "ADA", "Cardano", "A", "6", "meme"}, body), 2);
    EXPECT_EQ(body["error"], "INVALID_INPUT");
}

TEST_F(LedgerCommandHandlerTest, CurrencyAdd_DecimalsWithTrailingText_Usage) {
    json body;
    EXPECT_EQ(run({"currency", "add", "ADA", "Cardano", "A", "3abc", "crypto"}, body), 2);
    EXPECT_EQ(body["error"], "INVALID_INPUT");

    run({"currency", "list", "--all"}, body);
    EXPECT_EQ(body.size(), 9u);
}

TEST_F(LedgerCommandHandlerTest, CurrencyDisable_HiddenUnlessAll) {
    json body;
    ASSERT_EQ(run({"currency", "disable", "bnb"}, body), 0);
    EXPECT_EQ(body["enabled"], false);

    run({"currency", "list", "--class", "crypto"}, body);
    EXPECT_EQ(body.size(), 3u);
    run({"currency", "list", "--class", "crypto", "--all"}, body);
    EXPECT_EQ(body.size(), 4u);
}

// ============================================================================
// rate
// ============================================================================

TEST_F(LedgerCommandHandlerTest, RateSet_LatestAndConvert) {
    json body;
    ASSERT_EQ(run({"rate", "set", "USD", "CRC", "505.5", "--at", "2025-01-01T00:00:00Z"}, body), 0);
    EXPECT_TRUE(body["id"].is_number());

    ASSERT_EQ(run({"rate", "latest", "USD", "CRC"}, body), 0);
    EXPECT_EQ(body["rate"], "505.5");
    EXPECT_EQ(body["source"], "manual");

    ASSERT_EQ(run({"rate", "convert", "2", "USD", "CRC"}, body), 0);
    EXPECT_EQ(body["converted"], "1011");
}

TEST_F(LedgerCommandHandlerTest, RateHistory_LimitApplied) {
    json body;
    run({"rate", "set", "EUR", "USD", "1.1", "--at", "2025-01-01"}, body);
    run({"rate", "set", "EUR", "USD", "1.2", "--at", "2025-01-02"}, body);
    run({"rate", "set", "EUR", "USD", "1.3", "--at", "2025-01-03"}, body);

    ASSERT_EQ(run({"rate", "history", "EUR", "USD", "--limit", "2"}, body), 0);
    ASSERT_EQ(body.size(), 2u);
    EXPECT_EQ(body[0]["rate"], "1.3");
    EXPECT_EQ(body[1]["rate"], "1.2");
}

TEST_F(LedgerCommandHandlerTest, RateAsOf_BadTimestamp_Usage) {
    json body;
    EXPECT_EQ(run({"rate", "asof", "EUR", "USD", "last tuesday"}, body), 2);
    EXPECT_EQ(body["error"], "INVALID_INPUT");
}

TEST_F(LedgerCommandHandlerTest, RateConvert_NoRate_Failed) {
    json body;
    EXPECT_EQ(run({"rate", "convert", "1", "EUR", "CRC"}, body), 1);
    EXPECT_EQ(body["error"], "RATE_UNAVAILABLE");
}

// ============================================================================
// tx
// ============================================================================

TEST_F(LedgerCommandHandlerTest, TxBuy_ThenSell_RealizedPnl) {
    json body;
    ASSERT_EQ(run({"tx", "buy", "Coinbase", "BTC", "0.2", "55000", "--notes", "dca"}, body), 0);
    EXPECT_EQ(body["transaction"]["type"], "buy");
    EXPECT_EQ(body["transaction"]["notes"], "dca");
    EXPECT_EQ(body["holdings"][0]["avg_cost_basis"], "55000");

    ASSERT_EQ(run({"tx", "sell", "Coinbase", "BTC", "0.1", "70000"}, body), 0);
    EXPECT_EQ(body["realized_pnl"], "1500");
}

TEST_F(LedgerCommandHandlerTest, TxTransfer_WithFee) {
    json body;
    run({"tx", "buy", "Coinbase", "BTC", "0.5", "40000"}, body);
    ASSERT_EQ(run({"tx", "transfer", "Coinbase", "Ledger", "BTC", "0.2", "--fee", "0.001"}, body), 0);
    EXPECT_EQ(body["transaction"]["to_quantity"], "0.199");
    EXPECT_EQ(body["holdings"][1]["quantity"], "0.199");
}

TEST_F(LedgerCommandHandlerTest, TxSwap_FiatCapturesRate) {
    json body;
    holdings_->apply("Bank", "CRC", d("100000"), std::nullopt, std::nullopt);
    ASSERT_EQ(run({"tx", "swap", "Bank", "CRC", "100000", "Bank", "USD", "181.82"}, body), 0);
    EXPECT_EQ(body["captured_rate"]["from"], "USD");
    EXPECT_EQ(body["captured_rate"]["source"], "swap");
}

TEST_F(LedgerCommandHandlerTest, TxBuy_UnknownAccount_ListsValidAccounts) {
    json body;
    ASSERT_EQ(run({"tx", "buy", "Binance", "BTC", "1", "50000"}, body), 1);
    EXPECT_EQ(body["error"], "NOT_FOUND");
    std::vector<std::string> expected = {"Bank", "Coinbase", "Kraken", "Ledger"};
    EXPECT_EQ(body["valid_accounts"].get<std::vector<std::string>>(), expected);
    EXPECT_TRUE(recorder_->list(10).value().empty());
}

TEST_F(LedgerCommandHandlerTest, TxBuy_BadQuantity_Usage) {
    json body;
    EXPECT_EQ(run({"tx", "buy", "Coinbase", "BTC", "lots", "50000"}, body), 2);
    EXPECT_EQ(body["error"], "INVALID_INPUT");

    EXPECT_EQ(run({"tx", "buy", "Coinbase", "BTC"}, body), 2);
    EXPECT_EQ(run({"tx", "refund", "Coinbase"}, body), 2);
}

TEST_F(LedgerCommandHandlerTest, TxSell_Insufficient_Failed) {
    json body;
    run({"tx", "buy", "Coinbase", "BTC", "0.2", "50000"}, body);
    ASSERT_EQ(run({"tx", "sell", "Coinbase", "BTC", "0.3", "60000"}, body), 1);
    EXPECT_EQ(body["error"], "INSUFFICIENT_HOLDINGS");
}

TEST_F(LedgerCommandHandlerTest, TxList_ByAccountAndLimit) {
    json body;
    run({"tx", "buy", "Coinbase", "BTC", "1", "50000"}, body);
    run({"tx", "buy", "Kraken", "ETH", "1", "3000"}, body);

    ASSERT_EQ(run({"tx", "list"}, body), 0);
    EXPECT_EQ(body.size(), 2u);
    ASSERT_EQ(run({"tx", "list", "--account", "Kraken"}, body), 0);
    ASSERT_EQ(body.size(), 1u);
    EXPECT_EQ(body[0]["to_asset"], "ETH");
    EXPECT_EQ(run({"tx", "list", "--limit", "0"}, body), 2);
    EXPECT_EQ(run({"tx", "list", "--limit", "5x"}, body), 2);
}

TEST_F(LedgerCommandHandlerTest, TxBuy_DryRun_NothingRecorded) {
    json body;
    ASSERT_EQ(run({"tx", "buy", "Coinbase", "BTC", "0.5", "40000", "--dry-run"}, body), 0);
    EXPECT_EQ(body["dry_run"], true);
    EXPECT_EQ(body["transaction"]["id"], 0);
    EXPECT_EQ(body["holdings"][0]["quantity"], "0.5");

    EXPECT_TRUE(recorder_->list(10).value().empty());
    EXPECT_FALSE(holdings_->get("Coinbase", "BTC").isOk());
}

TEST_F(LedgerCommandHandlerTest, TxSell_DryRunInsufficient_Failed) {
    json body;
    EXPECT_EQ(run({"tx", "sell", "Coinbase", "BTC", "1", "40000", "--dry-run"}, body), 1);
    EXPECT_EQ(body["error"], "INSUFFICIENT_HOLDINGS");
}

// ============================================================================
// import / export
// ============================================================================

class LedgerCommandHandlerFileTest : public LedgerCommandHandlerTest {
protected:
    void TearDown() override {
        std::remove(path_.c_str());
        LedgerCommandHandlerTest::TearDown();
    }

    void writeFile(const std::string& content) {
        std::ofstream file(path_);
        file << content;
    }

    std::string readFile() {
        std::ifstream file(path_);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    std::string path_ = ::testing::TempDir() + "ledger_cli_" +
        ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".csv";
};

TEST_F(LedgerCommandHandlerFileTest, Import_MixedRows_ReportsPerLine) {
    writeFile(
        "date,type,asset,quantity,price,to_account,notes\n"
        "2024-01-15,buy,BTC,1,40000,,first\n"
        "2024-01-16,sell,BTC,5,50000,,too much\n"
        "2024-01-17,transfer,BTC,0.5,,Ledger,\n"
        "2024-01-18,buy,BTC,abc,1,,\n"
        "2024-01-19,transfer,BTC,0.1,,Nowhere,\n");

    json body;
    ASSERT_EQ(run({"import", path_, "--account", "Coinbase"}, body), 1);
    EXPECT_EQ(body["imported"], 2);
    EXPECT_EQ(body["failed"], 3);
    ASSERT_EQ(body["errors"].size(), 3u);
    EXPECT_EQ(body["errors"][0]["line"], 3);
    EXPECT_EQ(body["errors"][0]["error"], "INSUFFICIENT_HOLDINGS");
    EXPECT_EQ(body["errors"][1]["line"], 5);
    EXPECT_EQ(body["errors"][1]["error"], "INVALID_INPUT");
    EXPECT_EQ(body["errors"][2]["line"], 6);
    EXPECT_EQ(body["errors"][2]["error"], "NOT_FOUND");

    EXPECT_EQ(holding("Coinbase", "BTC").quantity, d("0.5"));
    EXPECT_EQ(holding("Ledger", "BTC").quantity, d("0.5"));
}

TEST_F(LedgerCommandHandlerFileTest, Import_AllRowsOk_ExitZero) {
    writeFile("date,type,asset,quantity,price\n2024-01-15,buy,ETH,2,2500\n");

    json body;
    ASSERT_EQ(run({"import", path_, "--account", "Kraken"}, body), 0);
    EXPECT_EQ(body["imported"], 1);
    EXPECT_TRUE(body["errors"].empty());
    EXPECT_EQ(body["transactions"].size(), 1u);
}

TEST_F(LedgerCommandHandlerFileTest, Import_BadInvocation) {
    json body;
    EXPECT_EQ(run({"import", path_}, body), 2);

    EXPECT_EQ(run({"import", path_, "--account", "Binance"}, body), 1);
    EXPECT_EQ(body["error"], "NOT_FOUND");

    EXPECT_EQ(run({"import", path_ + ".missing", "--account", "Coinbase"}, body), 1);
    EXPECT_EQ(body["error"], "INVALID_INPUT");

    writeFile("date,type\n");
    EXPECT_EQ(run({"import", path_, "--account", "Coinbase"}, body), 1);
    EXPECT_EQ(body["error"], "INVALID_INPUT");
}

TEST_F(LedgerCommandHandlerFileTest, Export_CsvFileFiltered) {
    json body;
    run({"tx", "buy", "Coinbase", "BTC", "1", "40000", "--at", "2024-01-01"}, body);
    run({"tx", "buy", "Kraken", "ETH", "1", "3000", "--at", "2024-01-02"}, body);
    run({"tx", "buy", "Coinbase", "ETH", "1", "3100", "--at", "2024-01-03"}, body);

    ASSERT_EQ(run({"tx", "export", path_, "--account", "Coinbase"}, body), 0);
    EXPECT_EQ(body["count"], 2);
    EXPECT_EQ(body["format"], "csv");

    std::istringstream lines(readFile());
    std::vector<std::string> rows;
    for (std::string line; std::getline(lines, line);) {
        rows.push_back(line);
    }
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].compare(0, 8, "id,date,"), 0);
    EXPECT_NE(rows[1].find(",BTC,"), std::string::npos);
    EXPECT_NE(rows[2].find(",ETH,"), std::string::npos);
}

TEST_F(LedgerCommandHandlerTest, Export_JsonToOutput) {
    json body;
    run({"tx", "buy", "Coinbase", "BTC", "1", "40000", "--at", "2024-01-01"}, body);
    run({"tx", "buy", "Kraken", "ETH", "1", "3000", "--at", "2024-01-05"}, body);

    ASSERT_EQ(run({"tx", "export", "-", "--format", "json", "--from", "2024-01-02"}, body), 0);
    ASSERT_TRUE(body.is_array());
    ASSERT_EQ(body.size(), 1u);
    EXPECT_EQ(body[0]["to_asset"], "ETH");

    EXPECT_EQ(run({"tx", "export", "-", "--format", "sql"}, body), 2);
    EXPECT_EQ(run({"tx", "export", "-", "--account", "Binance"}, body), 1);
    EXPECT_EQ(run({"tx", "export", "-", "--from", "2024-02-01", "--to", "2024-01-01"}, body), 1);
}

// ============================================================================
// holdings / portfolio
// ============================================================================

TEST_F(LedgerCommandHandlerTest, Holdings_AllAndByAccount) {
    json body;
    run({"tx", "buy", "Coinbase", "BTC", "1", "50000"}, body);
    run({"tx", "buy", "Kraken", "ETH", "1", "3000"}, body);

    ASSERT_EQ(run({"holdings"}, body), 0);
    EXPECT_EQ(body.size(), 2u);
    ASSERT_EQ(run({"holdings", "Kraken"}, body), 0);
    ASSERT_EQ(body.size(), 1u);
    EXPECT_EQ(body[0]["asset"], "ETH");
}

TEST_F(LedgerCommandHandlerTest, Portfolio_UsesPriceFeed) {
    ON_CALL(*priceFeed_, currentPrice("BTC")).WillByDefault(Return(d("60000")));

    json body;
    run({"tx", "buy", "Coinbase", "BTC", "0.2", "55000"}, body);
    ASSERT_EQ(run({"portfolio"}, body), 0);
    EXPECT_EQ(body["currency"], "USD");
    EXPECT_EQ(body["total_value"], "12000");
    EXPECT_EQ(body["unrealized_pnl"], "1000");
}

TEST_F(LedgerCommandHandlerTest, UnknownCommand_Usage) {
    json body;
    EXPECT_EQ(run({"explode"}, body), 2);
    EXPECT_EQ(run({}, body), 2);
    EXPECT_EQ(body["error"], "INVALID_INPUT");
}
