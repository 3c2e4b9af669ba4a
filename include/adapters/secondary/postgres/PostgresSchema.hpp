#pragma once

#include "adapters/secondary/SeedCurrencies.hpp"
#include "domain/Decimal.hpp"
#include <pqxx/pqxx>
#include <iostream>

namespace ledger::adapters::secondary::postgres {

/**
 * @brief Создание схемы ledger (идемпотентно)
 *
 * Таблицы:
 * - currencies      каталог валют, начальные 9 валют
 * - exchange_rates  история курсов, UNIQUE(from, to, timestamp)
 * - holdings        позиции, PK(account_id, asset)
 * - transactions    журнал (только добавление)
 * - categories, accounts  ведутся внешним инструментом
 *
 * Все десятичные значения - NUMERIC(39,18): 21 целый знак вмещает
 * весь диапазон domain::Decimal (до ~1.7e20).
 */
class PostgresSchema {
public:
    static constexpr int NUMERIC_PRECISION = 39;
    static constexpr int NUMERIC_SCALE = 18;
    static_assert(NUMERIC_SCALE == domain::Decimal::SCALE, "NUMERIC scale must match Decimal::SCALE");

    static void init(pqxx::connection& conn) {
        try {
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS currencies (
                    code VARCHAR(10) PRIMARY KEY,
                    name TEXT NOT NULL,
                    symbol TEXT NOT NULL,
                    decimals INTEGER NOT NULL DEFAULT 2 CHECK (decimals BETWEEN 0 AND 18),
                    asset_class VARCHAR(16) NOT NULL CHECK (asset_class IN ('fiat', 'crypto', 'stablecoin')),
                    enabled BOOLEAN NOT NULL DEFAULT TRUE,
                    created_at TIMESTAMPTZ DEFAULT NOW(),
                    updated_at TIMESTAMPTZ DEFAULT NOW()
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS exchange_rates (
                    id BIGSERIAL PRIMARY KEY,
                    from_currency VARCHAR(10) NOT NULL REFERENCES currencies(code),
                    to_currency VARCHAR(10) NOT NULL REFERENCES currencies(code),
                    rate NUMERIC(39,18) NOT NULL CHECK (rate > 0),
                    timestamp TIMESTAMPTZ NOT NULL,
                    source VARCHAR(32) NOT NULL DEFAULT 'manual',
                    notes TEXT,
                    UNIQUE (from_currency, to_currency, timestamp)
                )
            )");

            txn.exec(R"(
                CREATE INDEX IF NOT EXISTS idx_exchange_rates_pair
                    ON exchange_rates (from_currency, to_currency, timestamp DESC)
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS categories (
                    id TEXT PRIMARY KEY,
                    name TEXT NOT NULL UNIQUE,
                    sort_order INTEGER NOT NULL DEFAULT 0
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS accounts (
                    id TEXT PRIMARY KEY,
                    name TEXT NOT NULL UNIQUE,
                    category_id TEXT REFERENCES categories(id),
                    account_type VARCHAR(32) NOT NULL CHECK (account_type IN
                        ('exchange', 'hardware_wallet', 'software_wallet', 'custodial_service', 'bank'))
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS holdings (
                    account_id TEXT NOT NULL,
                    asset VARCHAR(10) NOT NULL,
                    quantity NUMERIC(39,18) NOT NULL CHECK (quantity >= 0),
                    avg_cost_basis NUMERIC(39,18) NOT NULL DEFAULT 0,
                    cost_basis_currency VARCHAR(10) NOT NULL,
                    updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                    PRIMARY KEY (account_id, asset)
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS transactions (
                    id BIGSERIAL PRIMARY KEY,
                    tx_type VARCHAR(16) NOT NULL CHECK (tx_type IN ('buy', 'sell', 'transfer', 'swap')),
                    from_account_id TEXT,
                    from_asset VARCHAR(10),
                    from_quantity NUMERIC(39,18),
                    to_account_id TEXT,
                    to_asset VARCHAR(10),
                    to_quantity NUMERIC(39,18),
                    unit_price NUMERIC(39,18),
                    price_currency VARCHAR(10),
                    fee NUMERIC(39,18),
                    fee_asset VARCHAR(10),
                    exchange_rate NUMERIC(39,18),
                    timestamp TIMESTAMPTZ NOT NULL,
                    notes TEXT
                )
            )");

            txn.exec(R"(
                CREATE INDEX IF NOT EXISTS idx_transactions_timestamp
                    ON transactions (timestamp DESC, id DESC)
            )");

            for (const auto& currency : seedCurrencies()) {
                txn.exec_params(
                    R"(
                        INSERT INTO currencies (code, name, symbol, decimals, asset_class, enabled)
                        VALUES ($1, $2, $3, $4, $5, TRUE)
                        ON CONFLICT (code) DO NOTHING
                    )",
                    currency.code,
                    currency.displayName,
                    currency.symbol,
                    currency.decimalPrecision,
                    domain::toString(currency.assetClass)
                );
            }

            txn.commit();
            std::cout << "[PostgresSchema] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresSchema] init error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace ledger::adapters::secondary::postgres
