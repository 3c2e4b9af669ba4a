#pragma once

#include <gtest/gtest.h>

#include "application/CurrencyCatalog.hpp"
#include "application/ExchangeRateStore.hpp"
#include "application/HoldingsLedger.hpp"
#include "application/TransactionRecorder.hpp"
#include "application/PortfolioAggregator.hpp"
#include "application/RateConverter.hpp"
#include "adapters/secondary/memory/InMemoryLedgerStore.hpp"
#include "adapters/secondary/memory/InMemoryAccountRegistry.hpp"
#include "mocks/TestLedgerSettings.hpp"

namespace ledger::tests {

// ============================================================================
// Общая фикстура: сервисы поверх in-memory хранилища
// ============================================================================

class LedgerTestFixture : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<TestLedgerSettings>();
        registry_ = std::make_shared<adapters::secondary::memory::InMemoryAccountRegistry>();
        registry_->add(domain::Account{"acc-coinbase", "Coinbase", domain::AccountType::EXCHANGE, "Trading"});
        registry_->add(domain::Account{"acc-kraken", "Kraken", domain::AccountType::EXCHANGE, "Trading"});
        registry_->add(domain::Account{"acc-ledger", "Ledger", domain::AccountType::HARDWARE_WALLET, "Cold Storage"});
        registry_->add(domain::Account{"acc-bank", "Bank", domain::AccountType::BANK, "Fiat"});

        memoryStore_ = std::make_shared<adapters::secondary::memory::InMemoryLedgerStore>();
        buildServices(memoryStore_);
    }

    /**
     * @brief Пересобрать сервисы поверх другого хранилища (например, декоратора)
     */
    void buildServices(std::shared_ptr<ports::output::ILedgerStore> store) {
        store_ = store;
        converter_ = std::make_shared<application::RateConverter>(settings_);
        catalog_ = std::make_shared<application::CurrencyCatalog>(store_);
        rates_ = std::make_shared<application::ExchangeRateStore>(store_, settings_, converter_);
        holdings_ = std::make_shared<application::HoldingsLedger>(store_, registry_, settings_);
        recorder_ = std::make_shared<application::TransactionRecorder>(
            store_, registry_, settings_, holdings_, rates_, converter_);
        portfolio_ = std::make_shared<application::PortfolioAggregator>(
            store_, registry_, settings_, converter_);
    }

    static domain::Decimal d(const std::string& text) {
        return domain::Decimal::fromString(text);
    }

    domain::Result<domain::TransactionResult> buy(const std::string& account, const std::string& asset,
                                                  const std::string& quantity, const std::string& price) {
        return recorder_->record(domain::TransactionRequest(
            domain::BuyRequest{account, asset, d(quantity), d(price), std::nullopt}));
    }

    domain::Result<domain::TransactionResult> sell(const std::string& account, const std::string& asset,
                                                   const std::string& quantity, const std::string& price) {
        return recorder_->record(domain::TransactionRequest(
            domain::SellRequest{account, asset, d(quantity), d(price), std::nullopt}));
    }

    domain::Holding holding(const std::string& account, const std::string& asset) {
        auto result = holdings_->get(account, asset);
        EXPECT_TRUE(result.isOk()) << result.error().message;
        return result.isOk() ? result.value() : domain::Holding{};
    }

    std::shared_ptr<TestLedgerSettings> settings_;
    std::shared_ptr<adapters::secondary::memory::InMemoryAccountRegistry> registry_;
    std::shared_ptr<adapters::secondary::memory::InMemoryLedgerStore> memoryStore_;
    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<application::RateConverter> converter_;
    std::shared_ptr<application::CurrencyCatalog> catalog_;
    std::shared_ptr<application::ExchangeRateStore> rates_;
    std::shared_ptr<application::HoldingsLedger> holdings_;
    std::shared_ptr<application::TransactionRecorder> recorder_;
    std::shared_ptr<application::PortfolioAggregator> portfolio_;
};

} // namespace ledger::tests
