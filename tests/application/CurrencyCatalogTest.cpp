#include <gtest/gtest.h>

#include "LedgerTestFixture.hpp"

using namespace ledger;
using namespace ledger::tests;
using domain::AssetClass;
using domain::Currency;
using domain::ErrorCode;

class CurrencyCatalogTest : public LedgerTestFixture {};

// ============================================================================
// Регистрация
// ============================================================================

TEST_F(CurrencyCatalogTest, Register_NewCode_NormalizedAndStored) {
    auto result = catalog_->registerCurrency(Currency(" doge ", "Dogecoin", "Ð", 8, AssetClass::CRYPTO));
    ASSERT_TRUE(result.isOk()) << result.error().message;
    EXPECT_EQ(result.value().code, "DOGE");

    auto stored = catalog_->get("Doge");
    ASSERT_TRUE(stored.isOk());
    EXPECT_EQ(stored.value().displayName, "Dogecoin");
    EXPECT_EQ(stored.value().decimalPrecision, 8);
}

TEST_F(CurrencyCatalogTest, Register_Duplicate_AlreadyExists) {
    auto result = catalog_->registerCurrency(Currency("usd", "Another Dollar", "$", 2, AssetClass::FIAT));
    ASSERT_FALSE(result.isOk());
    EXPECT_EQ(result.error().code, ErrorCode::ALREADY_EXISTS);
}

TEST_F(CurrencyCatalogTest, Register_InvalidCode_InvalidInput) {
    for (const auto& code : {"X", "TOOLONGCODE1", "US-D", ""}) {
        auto result = catalog_->registerCurrency(Currency(code, "Bad", "?", 2, AssetClass::FIAT));
        ASSERT_FALSE(result.isOk()) << code;
        EXPECT_EQ(result.error().code, ErrorCode::INVALID_INPUT) << code;
    }
}

TEST_F(CurrencyCatalogTest, Register_PrecisionOutOfRange_InvalidInput) {
    auto tooPrecise = catalog_->registerCurrency(Currency("ABC", "Abc", "A", 19, AssetClass::CRYPTO));
    ASSERT_FALSE(tooPrecise.isOk());
    EXPECT_EQ(tooPrecise.error().code, ErrorCode::INVALID_INPUT);

    auto noName = catalog_->registerCurrency(Currency("ABC", "", "A", 2, AssetClass::CRYPTO));
    ASSERT_FALSE(noName.isOk());
    EXPECT_EQ(noName.error().code, ErrorCode::INVALID_INPUT);
}

// ============================================================================
// Список и включение
// ============================================================================

TEST_F(CurrencyCatalogTest, List_Seeded_OrderedByClassThenCode) {
    auto result = catalog_->list(std::nullopt, true);
    ASSERT_TRUE(result.isOk());

    std::vector<std::string> codes;
    for (const auto& currency : result.value()) {
        codes.push_back(currency.code);
    }
    std::vector<std::string> expected = {"CRC", "EUR", "USD", "USDC", "USDT", "BNB", "BTC", "ETH", "SOL"};
    EXPECT_EQ(codes, expected);
}

TEST_F(CurrencyCatalogTest, List_FilterByClass_OnlyThatClass) {
    auto result = catalog_->list(AssetClass::STABLECOIN, true);
    ASSERT_TRUE(result.isOk());
    ASSERT_EQ(result.value().size(), 2u);
    for (const auto& currency : result.value()) {
        EXPECT_EQ(currency.assetClass, AssetClass::STABLECOIN);
    }
}

TEST_F(CurrencyCatalogTest, SetEnabled_Disable_HiddenFromEnabledList) {
    ASSERT_TRUE(catalog_->setEnabled("sol", false).isOk());

    auto enabled = catalog_->list(AssetClass::CRYPTO, true);
    ASSERT_TRUE(enabled.isOk());
    EXPECT_EQ(enabled.value().size(), 3u);

    auto all = catalog_->list(AssetClass::CRYPTO, false);
    ASSERT_TRUE(all.isOk());
    EXPECT_EQ(all.value().size(), 4u);

    // Идемпотентно
    EXPECT_TRUE(catalog_->setEnabled("SOL", false).isOk());
    EXPECT_TRUE(catalog_->setEnabled("SOL", true).isOk());
    EXPECT_TRUE(catalog_->get("SOL").value().enabled);
}

TEST_F(CurrencyCatalogTest, SetEnabled_UnknownCode_NotFound) {
    auto result = catalog_->setEnabled("XYZ", false);
    ASSERT_FALSE(result.isOk());
    EXPECT_EQ(result.error().code, ErrorCode::NOT_FOUND);
}

TEST_F(CurrencyCatalogTest, Get_Unknown_NotFound) {
    auto result = catalog_->get("NOPE");
    ASSERT_FALSE(result.isOk());
    EXPECT_EQ(result.error().code, ErrorCode::NOT_FOUND);
    EXPECT_EQ(result.error().message, "Unknown currency: NOPE");
}

// ============================================================================
// Форматирование
// ============================================================================

TEST_F(CurrencyCatalogTest, Format_UsesSymbolAndPrecision) {
    EXPECT_EQ(catalog_->format("USD", d("1234.567")).value(), "$1234.57");
    EXPECT_EQ(catalog_->format("BTC", d("0.123456789")).value(), "₿0.12345679");
    EXPECT_EQ(catalog_->format("USD", d("-5")).value(), "-$5.00");
}
