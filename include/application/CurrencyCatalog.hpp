#pragma once

#include "ports/input/ICurrencyCatalog.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "application/ServiceGuard.hpp"
#include "application/LedgerChecks.hpp"
#include <algorithm>
#include <iostream>
#include <memory>

namespace ledger::application {

/**
 * @brief Сервис каталога валют
 */
class CurrencyCatalog : public ports::input::ICurrencyCatalog {
public:
    explicit CurrencyCatalog(std::shared_ptr<ports::output::ILedgerStore> store)
        : store_(std::move(store))
    {}

    domain::Result<domain::Currency> registerCurrency(const domain::Currency& currency) override {
        return guarded("CurrencyCatalog", [&] {
            domain::Currency normalized = currency;
            normalized.code = normalizeCode(currency.code);

            if (!isValidCode(normalized.code)) {
                throw domain::LedgerException(domain::ErrorCode::INVALID_INPUT,
                    "Invalid currency code '" + currency.code + "': expected 2-10 characters A-Z, 0-9");
            }
            if (normalized.displayName.empty()) {
                throw domain::LedgerException(domain::ErrorCode::INVALID_INPUT,
                    "Display name must not be empty");
            }
            if (normalized.decimalPrecision < 0 || normalized.decimalPrecision > domain::Decimal::SCALE) {
                throw domain::LedgerException(domain::ErrorCode::INVALID_INPUT,
                    "Decimal precision must be within 0..18");
            }

            auto session = store_->openSession(ports::output::SessionMode::SERIALIZABLE);
            if (!session->currencies().insert(normalized)) {
                throw domain::LedgerException(domain::ErrorCode::ALREADY_EXISTS,
                    "Currency already exists: " + normalized.code);
            }
            session->commit();

            std::cout << "[CurrencyCatalog] Registered " << normalized.code
                      << " (" << toString(normalized.assetClass) << ")" << std::endl;
            return normalized;
        });
    }

    domain::Result<domain::Currency> get(const std::string& code) override {
        return guarded("CurrencyCatalog", [&] {
            auto session = store_->openSession(ports::output::SessionMode::READ_ONLY);
            return requireCurrency(session->currencies(), code);
        });
    }

    domain::Result<std::vector<domain::Currency>> list(
        std::optional<domain::AssetClass> assetClass,
        bool enabledOnly
    ) override {
        return guarded("CurrencyCatalog", [&] {
            auto session = store_->openSession(ports::output::SessionMode::READ_ONLY);
            auto all = session->currencies().findAll();

            std::vector<domain::Currency> result;
            for (auto& currency : all) {
                if (assetClass && currency.assetClass != *assetClass) {
                    continue;
                }
                if (enabledOnly && !currency.enabled) {
                    continue;
                }
                result.push_back(std::move(currency));
            }

            std::sort(result.begin(), result.end(),
                [](const domain::Currency& a, const domain::Currency& b) {
                    int orderA = sortOrder(a.assetClass);
                    int orderB = sortOrder(b.assetClass);
                    if (orderA != orderB) {
                        return orderA < orderB;
                    }
                    return a.code < b.code;
                });
            return result;
        });
    }

    domain::Result<domain::Unit> setEnabled(const std::string& code, bool enabled) override {
        return guarded("CurrencyCatalog", [&] {
            auto normalized = normalizeCode(code);
            auto session = store_->openSession(ports::output::SessionMode::SERIALIZABLE);
            if (!session->currencies().setEnabled(normalized, enabled)) {
                throw domain::LedgerException(domain::ErrorCode::NOT_FOUND,
                    "Unknown currency: " + normalized);
            }
            session->commit();

            std::cout << "[CurrencyCatalog] " << normalized
                      << (enabled ? " enabled" : " disabled") << std::endl;
            return domain::Unit{};
        });
    }

    domain::Result<std::string> format(const std::string& code, const domain::Decimal& amount) override {
        return guarded("CurrencyCatalog", [&] {
            auto session = store_->openSession(ports::output::SessionMode::READ_ONLY);
            return requireCurrency(session->currencies(), code).formatAmount(amount);
        });
    }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
};

} // namespace ledger::application
