#include <gtest/gtest.h>

#include "adapters/secondary/prices/JsonFilePriceFeed.hpp"
#include "mocks/TestLedgerSettings.hpp"

#include <cstdio>
#include <fstream>

using namespace ledger;
using namespace ledger::tests;
using adapters::secondary::JsonFilePriceFeed;
using domain::Decimal;

class JsonFilePriceFeedTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<TestLedgerSettings>();
        settings_->pricesFile = ::testing::TempDir() + "ledger_prices_" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json";
    }

    void TearDown() override {
        std::remove(settings_->pricesFile.c_str());
    }

    void writeFile(const std::string& content) {
        std::ofstream file(settings_->pricesFile);
        file << content;
    }

    std::shared_ptr<TestLedgerSettings> settings_;
};

TEST_F(JsonFilePriceFeedTest, CurrentPrice_StringsAndNumbers) {
    writeFile(R"({"BTC": "65000.50", "eth": 3500, "SOL": 150.25})");
    JsonFilePriceFeed feed(settings_);

    EXPECT_EQ(feed.currentPrice("BTC"), Decimal::fromString("65000.50"));
    EXPECT_EQ(feed.currentPrice("ETH"), Decimal::fromInt(3500));
    EXPECT_EQ(feed.currentPrice("sol"), Decimal::fromString("150.25"));
    EXPECT_FALSE(feed.currentPrice("BNB").has_value());
}

TEST_F(JsonFilePriceFeedTest, CurrentPrice_InvalidEntriesSkipped) {
    writeFile(R"({"BTC": "n/a", "ETH": "-1", "USDT": "1", "SOL": null})");
    JsonFilePriceFeed feed(settings_);

    EXPECT_FALSE(feed.currentPrice("BTC").has_value());
    EXPECT_FALSE(feed.currentPrice("ETH").has_value());
    EXPECT_FALSE(feed.currentPrice("SOL").has_value());
    EXPECT_EQ(feed.currentPrice("USDT"), Decimal::one());
}

TEST_F(JsonFilePriceFeedTest, CurrentPrice_MissingFile_NoPrices) {
    JsonFilePriceFeed feed(settings_);
    EXPECT_FALSE(feed.currentPrice("BTC").has_value());
}

TEST_F(JsonFilePriceFeedTest, CurrentPrice_NotAnObject_Throws) {
    writeFile(R"(["BTC", 65000])");
    JsonFilePriceFeed feed(settings_);
    EXPECT_THROW(feed.currentPrice("BTC"), domain::LedgerException);
}

TEST_F(JsonFilePriceFeedTest, CurrentPrice_BrokenJson_Throws) {
    writeFile("{\"BTC\": ");
    JsonFilePriceFeed feed(settings_);
    try {
        feed.currentPrice("BTC");
        FAIL() << "Expected LedgerException";
    } catch (const domain::LedgerException& e) {
        EXPECT_EQ(e.code(), domain::ErrorCode::INVALID_INPUT);
    }
}
