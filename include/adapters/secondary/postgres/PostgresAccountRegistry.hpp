#pragma once

#include "ports/output/IAccountRegistry.hpp"
#include "settings/DbSettings.hpp"
#include "PgSupport.hpp"
#include <pqxx/pqxx>
#include <memory>

namespace ledger::adapters::secondary::postgres {

/**
 * @brief Реестр счетов поверх таблиц accounts / categories
 *
 * Таблицы ведёт внешний инструмент управления счетами, здесь только чтение.
 */
class PostgresAccountRegistry : public ports::output::IAccountRegistry {
public:
    explicit PostgresAccountRegistry(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {}

    std::optional<domain::Account> resolve(const std::string& nameOrId) override {
        return pgCall("PostgresAccountRegistry", "resolve", [&]() -> std::optional<domain::Account> {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::read_transaction txn(conn);

            auto result = txn.exec_params(
                selectColumns() + " WHERE a.id = $1 OR lower(a.name) = lower($1) "
                "ORDER BY (a.id = $1) DESC LIMIT 1",
                nameOrId
            );
            if (result.empty()) {
                return std::nullopt;
            }
            return rowToAccount(result[0]);
        });
    }

    std::vector<domain::Account> findAll() override {
        return pgCall("PostgresAccountRegistry", "findAll", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::read_transaction txn(conn);

            auto result = txn.exec(selectColumns() + " ORDER BY a.name");
            std::vector<domain::Account> accounts;
            for (const auto& row : result) {
                accounts.push_back(rowToAccount(row));
            }
            return accounts;
        });
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    static std::string selectColumns() {
        return "SELECT a.id, a.name, a.account_type, COALESCE(c.name, 'Uncategorized') AS category "
               "FROM accounts a LEFT JOIN categories c ON c.id = a.category_id";
    }

    static domain::Account rowToAccount(const pqxx::row& row) {
        domain::Account account;
        account.id = row["id"].as<std::string>();
        account.name = row["name"].as<std::string>();
        account.accountType = domain::accountTypeFromString(row["account_type"].as<std::string>());
        account.category = row["category"].as<std::string>();
        return account;
    }
};

} // namespace ledger::adapters::secondary::postgres
