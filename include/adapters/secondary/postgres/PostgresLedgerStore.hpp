#pragma once

#include "ports/output/ILedgerStore.hpp"
#include "settings/DbSettings.hpp"
#include "PostgresRepositories.hpp"
#include "PostgresSchema.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace ledger::adapters::secondary::postgres {

/**
 * @brief Сессия PostgreSQL: одно соединение и одна транзакция
 *
 * SERIALIZABLE - пишущая транзакция, READ_ONLY - read committed только для чтения.
 * Деструктор без commit() откатывает транзакцию (поведение pqxx).
 */
class PostgresLedgerSession : public ports::output::ILedgerSession {
public:
    PostgresLedgerSession(const std::string& connectionString, ports::output::SessionMode mode) {
        pgCall("PostgresLedgerSession", "open", [&] {
            connection_ = std::make_unique<pqxx::connection>(connectionString);
            if (mode == ports::output::SessionMode::SERIALIZABLE) {
                txn_ = std::make_unique<pqxx::transaction<pqxx::isolation_level::serializable>>(*connection_);
            } else {
                txn_ = std::make_unique<pqxx::transaction<pqxx::isolation_level::read_committed,
                                                          pqxx::write_policy::read_only>>(*connection_);
            }
        });

        currencies_ = std::make_unique<PostgresCurrencyRepository>(*txn_);
        rates_ = std::make_unique<PostgresExchangeRateRepository>(*txn_);
        holdings_ = std::make_unique<PostgresHoldingRepository>(*txn_);
        transactions_ = std::make_unique<PostgresTransactionRepository>(*txn_);
    }

    ports::output::ICurrencyRepository& currencies() override { return *currencies_; }
    ports::output::IExchangeRateRepository& exchangeRates() override { return *rates_; }
    ports::output::IHoldingRepository& holdings() override { return *holdings_; }
    ports::output::ITransactionRepository& transactions() override { return *transactions_; }

    void commit() override {
        pgCall("PostgresLedgerSession", "commit", [&] { txn_->commit(); });
    }

private:
    // Порядок членов важен: транзакция уничтожается раньше соединения
    std::unique_ptr<pqxx::connection> connection_;
    std::unique_ptr<pqxx::transaction_base> txn_;

    std::unique_ptr<PostgresCurrencyRepository> currencies_;
    std::unique_ptr<PostgresExchangeRateRepository> rates_;
    std::unique_ptr<PostgresHoldingRepository> holdings_;
    std::unique_ptr<PostgresTransactionRepository> transactions_;
};

/**
 * @brief PostgreSQL реализация хранилища
 *
 * Одно соединение на сессию. При создании проверяет подключение и схему.
 */
class PostgresLedgerStore : public ports::output::ILedgerStore {
public:
    explicit PostgresLedgerStore(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresLedgerStore] Connecting to " << settings_->getHost() << ":"
                  << settings_->getPort() << "/" << settings_->getName() << "..." << std::endl;
        try {
            pqxx::connection conn(settings_->getConnectionString());
            PostgresSchema::init(conn);
            std::cout << "[PostgresLedgerStore] Connected successfully" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::unique_ptr<ports::output::ILedgerSession> openSession(ports::output::SessionMode mode) override {
        return std::make_unique<PostgresLedgerSession>(settings_->getConnectionString(), mode);
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace ledger::adapters::secondary::postgres
