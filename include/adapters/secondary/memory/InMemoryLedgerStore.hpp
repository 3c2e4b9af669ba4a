#pragma once

#include "ports/output/ILedgerStore.hpp"
#include "adapters/secondary/SeedCurrencies.hpp"
#include "InMemoryRepositories.hpp"
#include <iostream>
#include <memory>
#include <mutex>
#include <shared_mutex>

namespace ledger::adapters::secondary::memory {

/**
 * @brief Сессия in-memory хранилища
 *
 * SERIALIZABLE: эксклюзивная блокировка на всё время жизни сессии,
 * работа над копией таблиц, commit подменяет таблицы хранилища.
 * READ_ONLY: снимок таблиц под разделяемой блокировкой.
 */
class InMemoryLedgerSession : public ports::output::ILedgerSession {
public:
    InMemoryLedgerSession(std::shared_mutex& mutex, LedgerTables& committed, ports::output::SessionMode mode)
        : committed_(committed)
        , readOnly_(mode == ports::output::SessionMode::READ_ONLY)
    {
        if (readOnly_) {
            std::shared_lock<std::shared_mutex> lock(mutex);
            working_ = committed_;
        } else {
            writeLock_ = std::unique_lock<std::shared_mutex>(mutex);
            working_ = committed_;
        }

        currencies_ = std::make_unique<InMemoryCurrencyRepository>(working_, readOnly_);
        rates_ = std::make_unique<InMemoryExchangeRateRepository>(working_, readOnly_);
        holdings_ = std::make_unique<InMemoryHoldingRepository>(working_, readOnly_);
        transactions_ = std::make_unique<InMemoryTransactionRepository>(working_, readOnly_);
    }

    ports::output::ICurrencyRepository& currencies() override { return *currencies_; }
    ports::output::IExchangeRateRepository& exchangeRates() override { return *rates_; }
    ports::output::IHoldingRepository& holdings() override { return *holdings_; }
    ports::output::ITransactionRepository& transactions() override { return *transactions_; }

    void commit() override {
        if (readOnly_) {
            return;
        }
        if (!writeLock_.owns_lock()) {
            throw std::logic_error("Session already committed");
        }
        committed_ = std::move(working_);
        writeLock_.unlock();
    }

private:
    LedgerTables& committed_;
    LedgerTables working_;
    bool readOnly_;
    std::unique_lock<std::shared_mutex> writeLock_;

    std::unique_ptr<InMemoryCurrencyRepository> currencies_;
    std::unique_ptr<InMemoryExchangeRateRepository> rates_;
    std::unique_ptr<InMemoryHoldingRepository> holdings_;
    std::unique_ptr<InMemoryTransactionRepository> transactions_;
};

/**
 * @brief In-memory реализация хранилища (LEDGER_STORAGE=memory, тесты)
 */
class InMemoryLedgerStore : public ports::output::ILedgerStore {
public:
    explicit InMemoryLedgerStore(bool seed = true) {
        if (seed) {
            for (const auto& currency : seedCurrencies()) {
                tables_.currencies.emplace(currency.code, currency);
            }
        }
        std::cout << "[InMemoryLedgerStore] Initialized with "
                  << tables_.currencies.size() << " currencies" << std::endl;
    }

    std::unique_ptr<ports::output::ILedgerSession> openSession(ports::output::SessionMode mode) override {
        return std::make_unique<InMemoryLedgerSession>(mutex_, tables_, mode);
    }

private:
    std::shared_mutex mutex_;
    LedgerTables tables_;
};

} // namespace ledger::adapters::secondary::memory
