#pragma once

#include "PgSupport.hpp"
#include "ports/output/ICurrencyRepository.hpp"
#include "ports/output/IExchangeRateRepository.hpp"
#include "ports/output/IHoldingRepository.hpp"
#include "ports/output/ITransactionRepository.hpp"
#include <pqxx/pqxx>

namespace ledger::adapters::secondary::postgres {

/**
 * @brief PostgreSQL репозиторий валют (таблица currencies)
 */
class PostgresCurrencyRepository : public ports::output::ICurrencyRepository {
public:
    explicit PostgresCurrencyRepository(pqxx::transaction_base& txn) : txn_(txn) {}

    bool insert(const domain::Currency& currency) override {
        return pgCall("PostgresCurrencyRepo", "insert", [&] {
            auto result = txn_.exec_params(
                R"(
                    INSERT INTO currencies (code, name, symbol, decimals, asset_class, enabled)
                    VALUES ($1, $2, $3, $4, $5, $6)
                    ON CONFLICT (code) DO NOTHING
                )",
                currency.code,
                currency.displayName,
                currency.symbol,
                currency.decimalPrecision,
                domain::toString(currency.assetClass),
                currency.enabled
            );
            return result.affected_rows() == 1;
        });
    }

    std::optional<domain::Currency> findByCode(const std::string& code) override {
        return pgCall("PostgresCurrencyRepo", "findByCode", [&]() -> std::optional<domain::Currency> {
            auto result = txn_.exec_params(
                "SELECT code, name, symbol, decimals, asset_class, enabled FROM currencies WHERE code = $1",
                code
            );
            if (result.empty()) {
                return std::nullopt;
            }
            return rowToCurrency(result[0]);
        });
    }

    std::vector<domain::Currency> findAll() override {
        return pgCall("PostgresCurrencyRepo", "findAll", [&] {
            auto result = txn_.exec(
                "SELECT code, name, symbol, decimals, asset_class, enabled FROM currencies ORDER BY code"
            );
            std::vector<domain::Currency> currencies;
            for (const auto& row : result) {
                currencies.push_back(rowToCurrency(row));
            }
            return currencies;
        });
    }

    bool setEnabled(const std::string& code, bool enabled) override {
        return pgCall("PostgresCurrencyRepo", "setEnabled", [&] {
            auto result = txn_.exec_params(
                "UPDATE currencies SET enabled = $2, updated_at = NOW() WHERE code = $1",
                code, enabled
            );
            return result.affected_rows() == 1;
        });
    }

private:
    pqxx::transaction_base& txn_;

    static domain::Currency rowToCurrency(const pqxx::row& row) {
        domain::Currency currency;
        currency.code = row["code"].as<std::string>();
        currency.displayName = row["name"].as<std::string>();
        currency.symbol = row["symbol"].as<std::string>();
        currency.decimalPrecision = row["decimals"].as<int>();
        currency.assetClass = domain::assetClassFromString(row["asset_class"].as<std::string>())
                                  .value_or(domain::AssetClass::CRYPTO);
        currency.enabled = row["enabled"].as<bool>();
        return currency;
    }
};

/**
 * @brief PostgreSQL репозиторий курсов (таблица exchange_rates)
 */
class PostgresExchangeRateRepository : public ports::output::IExchangeRateRepository {
public:
    explicit PostgresExchangeRateRepository(pqxx::transaction_base& txn) : txn_(txn) {}

    int64_t upsert(const domain::ExchangeRate& rate) override {
        return pgCall("PostgresRateRepo", "upsert", [&] {
            auto result = txn_.exec_params(
                R"(
                    INSERT INTO exchange_rates (from_currency, to_currency, rate, timestamp, source, notes)
                    VALUES ($1, $2, $3::numeric, $4::timestamptz, $5, $6)
                    ON CONFLICT (from_currency, to_currency, timestamp) DO UPDATE SET
                        rate = EXCLUDED.rate,
                        source = EXCLUDED.source,
                        notes = EXCLUDED.notes
                    RETURNING id
                )",
                rate.fromCurrency,
                rate.toCurrency,
                rate.rate.toString(),
                rate.timestamp.toString(),
                rate.source,
                rate.notes
            );
            return result[0][0].as<int64_t>();
        });
    }

    std::optional<domain::ExchangeRate> findLatest(const std::string& from, const std::string& to) override {
        return pgCall("PostgresRateRepo", "findLatest", [&]() -> std::optional<domain::ExchangeRate> {
            auto result = txn_.exec_params(
                selectColumns() +
                " WHERE from_currency = $1 AND to_currency = $2 ORDER BY timestamp DESC LIMIT 1",
                from, to
            );
            if (result.empty()) {
                return std::nullopt;
            }
            return rowToRate(result[0]);
        });
    }

    std::optional<domain::ExchangeRate> findAsOf(
        const std::string& from,
        const std::string& to,
        const domain::Timestamp& at
    ) override {
        return pgCall("PostgresRateRepo", "findAsOf", [&]() -> std::optional<domain::ExchangeRate> {
            auto result = txn_.exec_params(
                selectColumns() +
                " WHERE from_currency = $1 AND to_currency = $2 AND timestamp <= $3::timestamptz"
                " ORDER BY timestamp DESC LIMIT 1",
                from, to, at.toString()
            );
            if (result.empty()) {
                return std::nullopt;
            }
            return rowToRate(result[0]);
        });
    }

    std::vector<domain::ExchangeRate> findPage(
        const std::string& from,
        const std::string& to,
        const std::optional<domain::Timestamp>& before,
        size_t limit
    ) override {
        return pgCall("PostgresRateRepo", "findPage", [&] {
            std::optional<std::string> beforeParam;
            if (before) {
                beforeParam = before->toString();
            }
            auto result = txn_.exec_params(
                selectColumns() +
                " WHERE from_currency = $1 AND to_currency = $2"
                " AND ($3::timestamptz IS NULL OR timestamp < $3::timestamptz)"
                " ORDER BY timestamp DESC LIMIT $4",
                from, to, beforeParam, static_cast<int64_t>(limit)
            );
            std::vector<domain::ExchangeRate> page;
            for (const auto& row : result) {
                page.push_back(rowToRate(row));
            }
            return page;
        });
    }

private:
    pqxx::transaction_base& txn_;

    static std::string selectColumns() {
        return "SELECT id, from_currency, to_currency, rate::text AS rate, " +
               isoColumn("timestamp") + " AS ts, source, COALESCE(notes, '') AS notes FROM exchange_rates";
    }

    static domain::ExchangeRate rowToRate(const pqxx::row& row) {
        domain::ExchangeRate rate;
        rate.id = row["id"].as<int64_t>();
        rate.fromCurrency = row["from_currency"].as<std::string>();
        rate.toCurrency = row["to_currency"].as<std::string>();
        rate.rate = toDecimal(row["rate"]);
        rate.timestamp = toTimestamp(row["ts"]);
        rate.source = row["source"].as<std::string>();
        rate.notes = row["notes"].as<std::string>();
        return rate;
    }
};

/**
 * @brief PostgreSQL репозиторий позиций (таблица holdings)
 */
class PostgresHoldingRepository : public ports::output::IHoldingRepository {
public:
    explicit PostgresHoldingRepository(pqxx::transaction_base& txn) : txn_(txn) {}

    std::optional<domain::Holding> find(const std::string& accountId, const std::string& asset) override {
        return findOne(accountId, asset, "");
    }

    std::optional<domain::Holding> findForUpdate(const std::string& accountId, const std::string& asset) override {
        return findOne(accountId, asset, " FOR UPDATE");
    }

    std::vector<domain::Holding> findByAccount(const std::string& accountId) override {
        return pgCall("PostgresHoldingRepo", "findByAccount", [&] {
            auto result = txn_.exec_params(
                selectColumns() + " WHERE account_id = $1 ORDER BY asset",
                accountId
            );
            return rowsToHoldings(result);
        });
    }

    std::vector<domain::Holding> findAll() override {
        return pgCall("PostgresHoldingRepo", "findAll", [&] {
            auto result = txn_.exec(selectColumns() + " ORDER BY account_id, asset");
            return rowsToHoldings(result);
        });
    }

    void save(const domain::Holding& holding) override {
        pgCall("PostgresHoldingRepo", "save", [&] {
            txn_.exec_params(
                R"(
                    INSERT INTO holdings (account_id, asset, quantity, avg_cost_basis,
                                          cost_basis_currency, updated_at)
                    VALUES ($1, $2, $3::numeric, $4::numeric, $5, $6::timestamptz)
                    ON CONFLICT (account_id, asset) DO UPDATE SET
                        quantity = EXCLUDED.quantity,
                        avg_cost_basis = EXCLUDED.avg_cost_basis,
                        cost_basis_currency = EXCLUDED.cost_basis_currency,
                        updated_at = EXCLUDED.updated_at
                )",
                holding.accountId,
                holding.asset,
                holding.quantity.toString(),
                holding.avgCostBasis.toString(),
                holding.costBasisCurrency,
                holding.updatedAt.toString()
            );
        });
    }

    bool remove(const std::string& accountId, const std::string& asset) override {
        return pgCall("PostgresHoldingRepo", "remove", [&] {
            auto result = txn_.exec_params(
                "DELETE FROM holdings WHERE account_id = $1 AND asset = $2",
                accountId, asset
            );
            return result.affected_rows() > 0;
        });
    }

    size_t removeAll(const std::string& accountId) override {
        return pgCall("PostgresHoldingRepo", "removeAll", [&] {
            auto result = txn_.exec_params("DELETE FROM holdings WHERE account_id = $1", accountId);
            return static_cast<size_t>(result.affected_rows());
        });
    }

private:
    pqxx::transaction_base& txn_;

    std::optional<domain::Holding> findOne(
        const std::string& accountId,
        const std::string& asset,
        const std::string& lockClause
    ) {
        return pgCall("PostgresHoldingRepo", "find", [&]() -> std::optional<domain::Holding> {
            auto result = txn_.exec_params(
                selectColumns() + " WHERE account_id = $1 AND asset = $2" + lockClause,
                accountId, asset
            );
            if (result.empty()) {
                return std::nullopt;
            }
            return rowToHolding(result[0]);
        });
    }

    static std::string selectColumns() {
        return "SELECT account_id, asset, quantity::text AS quantity, avg_cost_basis::text AS avg_cost_basis, "
               "cost_basis_currency, " + isoColumn("updated_at") + " AS updated_at FROM holdings";
    }

    static domain::Holding rowToHolding(const pqxx::row& row) {
        domain::Holding holding;
        holding.accountId = row["account_id"].as<std::string>();
        holding.asset = row["asset"].as<std::string>();
        holding.quantity = toDecimal(row["quantity"]);
        holding.avgCostBasis = toDecimal(row["avg_cost_basis"]);
        holding.costBasisCurrency = row["cost_basis_currency"].as<std::string>();
        holding.updatedAt = toTimestamp(row["updated_at"]);
        return holding;
    }

    static std::vector<domain::Holding> rowsToHoldings(const pqxx::result& result) {
        std::vector<domain::Holding> holdings;
        for (const auto& row : result) {
            holdings.push_back(rowToHolding(row));
        }
        return holdings;
    }
};

/**
 * @brief PostgreSQL журнал транзакций (таблица transactions)
 */
class PostgresTransactionRepository : public ports::output::ITransactionRepository {
public:
    explicit PostgresTransactionRepository(pqxx::transaction_base& txn) : txn_(txn) {}

    int64_t append(const domain::TransactionRecord& record) override {
        return pgCall("PostgresTransactionRepo", "append", [&] {
            auto result = txn_.exec_params(
                R"(
                    INSERT INTO transactions (
                        tx_type, from_account_id, from_asset, from_quantity,
                        to_account_id, to_asset, to_quantity,
                        unit_price, price_currency, fee, fee_asset, exchange_rate,
                        timestamp, notes
                    )
                    VALUES ($1, $2, $3, $4::numeric, $5, $6, $7::numeric,
                            $8::numeric, $9, $10::numeric, $11, $12::numeric,
                            $13::timestamptz, $14)
                    RETURNING id
                )",
                domain::toString(record.type),
                record.fromAccountId,
                record.fromAsset,
                toParam(record.fromQuantity),
                record.toAccountId,
                record.toAsset,
                toParam(record.toQuantity),
                toParam(record.unitPrice),
                record.priceCurrency,
                toParam(record.fee),
                record.feeAsset,
                toParam(record.exchangeRate),
                record.timestamp.toString(),
                record.notes
            );
            return result[0][0].as<int64_t>();
        });
    }

    std::vector<domain::TransactionRecord> findRecent(size_t limit) override {
        return pgCall("PostgresTransactionRepo", "findRecent", [&] {
            auto result = txn_.exec_params(
                selectColumns() + " ORDER BY timestamp DESC, id DESC LIMIT $1",
                static_cast<int64_t>(limit)
            );
            return rowsToRecords(result);
        });
    }

    std::vector<domain::TransactionRecord> findByAccount(const std::string& accountId, size_t limit) override {
        return pgCall("PostgresTransactionRepo", "findByAccount", [&] {
            auto result = txn_.exec_params(
                selectColumns() +
                " WHERE from_account_id = $1 OR to_account_id = $1"
                " ORDER BY timestamp DESC, id DESC LIMIT $2",
                accountId, static_cast<int64_t>(limit)
            );
            return rowsToRecords(result);
        });
    }

    std::optional<domain::TransactionRecord> findById(int64_t id) override {
        return pgCall("PostgresTransactionRepo", "findById", [&]() -> std::optional<domain::TransactionRecord> {
            auto result = txn_.exec_params(selectColumns() + " WHERE id = $1", id);
            if (result.empty()) {
                return std::nullopt;
            }
            return rowToRecord(result[0]);
        });
    }

    std::vector<domain::TransactionRecord> findMatching(const domain::TransactionFilter& filter) override {
        return pgCall("PostgresTransactionRepo", "findMatching", [&] {
            std::optional<std::string> from;
            std::optional<std::string> to;
            if (filter.from) from = filter.from->toString();
            if (filter.to) to = filter.to->toString();

            auto result = txn_.exec_params(
                selectColumns() +
                " WHERE ($1::text IS NULL OR from_account_id = $1 OR to_account_id = $1)"
                " AND ($2::text IS NULL OR from_asset = $2 OR to_asset = $2)"
                " AND ($3::timestamptz IS NULL OR timestamp >= $3::timestamptz)"
                " AND ($4::timestamptz IS NULL OR timestamp <= $4::timestamptz)"
                " ORDER BY timestamp ASC, id ASC",
                filter.account, filter.asset, from, to
            );
            return rowsToRecords(result);
        });
    }

private:
    pqxx::transaction_base& txn_;

    static std::string selectColumns() {
        return "SELECT id, tx_type, from_account_id, from_asset, from_quantity::text AS from_quantity, "
               "to_account_id, to_asset, to_quantity::text AS to_quantity, "
               "unit_price::text AS unit_price, price_currency, fee::text AS fee, fee_asset, "
               "exchange_rate::text AS exchange_rate, " + isoColumn("timestamp") + " AS ts, "
               "COALESCE(notes, '') AS notes FROM transactions";
    }

    static domain::TransactionRecord rowToRecord(const pqxx::row& row) {
        domain::TransactionRecord record;
        record.id = row["id"].as<int64_t>();
        record.type = domain::transactionTypeFromString(row["tx_type"].as<std::string>());
        record.fromAccountId = toOptionalString(row["from_account_id"]);
        record.fromAsset = toOptionalString(row["from_asset"]);
        record.fromQuantity = toOptionalDecimal(row["from_quantity"]);
        record.toAccountId = toOptionalString(row["to_account_id"]);
        record.toAsset = toOptionalString(row["to_asset"]);
        record.toQuantity = toOptionalDecimal(row["to_quantity"]);
        record.unitPrice = toOptionalDecimal(row["unit_price"]);
        record.priceCurrency = toOptionalString(row["price_currency"]);
        record.fee = toOptionalDecimal(row["fee"]);
        record.feeAsset = toOptionalString(row["fee_asset"]);
        record.exchangeRate = toOptionalDecimal(row["exchange_rate"]);
        record.timestamp = toTimestamp(row["ts"]);
        record.notes = row["notes"].as<std::string>();
        return record;
    }

    static std::vector<domain::TransactionRecord> rowsToRecords(const pqxx::result& result) {
        std::vector<domain::TransactionRecord> records;
        for (const auto& row : result) {
            records.push_back(rowToRecord(row));
        }
        return records;
    }
};

} // namespace ledger::adapters::secondary::postgres
