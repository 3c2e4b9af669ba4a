#pragma once

#include "ports/input/IExchangeRateStore.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "settings/ILedgerSettings.hpp"
#include "application/RateConverter.hpp"
#include "application/ServiceGuard.hpp"
#include "application/LedgerChecks.hpp"
#include <iostream>
#include <memory>

namespace ledger::application {

/**
 * @brief Сервис истории курсов обмена
 */
class ExchangeRateStore : public ports::input::IExchangeRateStore {
public:
    ExchangeRateStore(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<settings::ILedgerSettings> settings,
        std::shared_ptr<RateConverter> converter
    ) : store_(std::move(store))
      , settings_(std::move(settings))
      , converter_(std::move(converter))
    {}

    domain::Result<int64_t> upsert(const domain::ExchangeRate& rate) override {
        return guarded("ExchangeRateStore", [&] {
            auto session = store_->openSession(ports::output::SessionMode::SERIALIZABLE);
            int64_t id = upsertIn(*session, rate);
            session->commit();

            std::cout << "[ExchangeRateStore] " << normalizeCode(rate.fromCurrency) << "/"
                      << normalizeCode(rate.toCurrency) << " = " << rate.rate
                      << " @ " << rate.timestamp.toString() << std::endl;
            return id;
        });
    }

    /**
     * @brief Проверить и записать курс внутри открытой сессии
     * @throws domain::LedgerException(NOT_FOUND / INVALID_INPUT)
     */
    int64_t upsertIn(ports::output::ILedgerSession& session, const domain::ExchangeRate& rate) {
        domain::ExchangeRate normalized = rate;
        normalized.fromCurrency = normalizeCode(rate.fromCurrency);
        normalized.toCurrency = normalizeCode(rate.toCurrency);
        if (normalized.source.empty()) {
            normalized.source = "manual";
        }

        if (normalized.fromCurrency == normalized.toCurrency) {
            throw domain::LedgerException(domain::ErrorCode::INVALID_INPUT,
                "Exchange rate currencies must differ: " + normalized.fromCurrency);
        }
        if (!normalized.rate.isPositive()) {
            throw domain::LedgerException(domain::ErrorCode::INVALID_INPUT,
                "Exchange rate must be positive");
        }
        requireCurrency(session.currencies(), normalized.fromCurrency);
        requireCurrency(session.currencies(), normalized.toCurrency);

        return session.exchangeRates().upsert(normalized);
    }

    domain::Result<domain::ExchangeRate> latest(const std::string& from, const std::string& to) override {
        return guarded("ExchangeRateStore", [&] {
            auto fromCode = normalizeCode(from);
            auto toCode = normalizeCode(to);
            auto session = store_->openSession(ports::output::SessionMode::READ_ONLY);
            auto rate = session->exchangeRates().findLatest(fromCode, toCode);
            if (!rate) {
                throw domain::LedgerException(domain::ErrorCode::NOT_FOUND,
                    "No exchange rate for " + fromCode + "/" + toCode);
            }
            return *rate;
        });
    }

    domain::Result<domain::ExchangeRate> asOf(
        const std::string& from,
        const std::string& to,
        const domain::Timestamp& at
    ) override {
        return guarded("ExchangeRateStore", [&] {
            auto fromCode = normalizeCode(from);
            auto toCode = normalizeCode(to);
            auto session = store_->openSession(ports::output::SessionMode::READ_ONLY);
            auto rate = session->exchangeRates().findAsOf(fromCode, toCode, at);
            if (!rate) {
                throw domain::LedgerException(domain::ErrorCode::NOT_FOUND,
                    "No exchange rate for " + fromCode + "/" + toCode + " as of " + at.toString());
            }
            return *rate;
        });
    }

    domain::Result<domain::RateHistory> history(const std::string& from, const std::string& to) override {
        return guarded("ExchangeRateStore", [&] {
            auto fromCode = normalizeCode(from);
            auto toCode = normalizeCode(to);
            {
                auto session = store_->openSession(ports::output::SessionMode::READ_ONLY);
                requireCurrency(session->currencies(), fromCode);
                requireCurrency(session->currencies(), toCode);
            }

            // Каждая страница читается в своей сессии. Страницы читаются уже после
            // возврата Result, поэтому любая ошибка хранилища приводится к LedgerException
            auto store = store_;
            domain::RateHistory::PageFetcher fetch =
                [store, fromCode, toCode](const std::optional<domain::Timestamp>& before, size_t limit) {
                    try {
                        auto session = store->openSession(ports::output::SessionMode::READ_ONLY);
                        return session->exchangeRates().findPage(fromCode, toCode, before, limit);
                    } catch (const domain::LedgerException&) {
                        throw;
                    } catch (const std::exception& e) {
                        std::cerr << "[ExchangeRateStore] History page failed: " << e.what() << std::endl;
                        throw domain::LedgerException(domain::ErrorCode::STORAGE_ERROR,
                                                      std::string("History page failed: ") + e.what());
                    }
                };
            return domain::RateHistory(std::move(fetch), settings_->getHistoryPageSize());
        });
    }

    domain::Result<domain::Decimal> convert(
        const domain::Decimal& amount,
        const std::string& from,
        const std::string& to,
        const domain::Timestamp& at
    ) override {
        return guarded("ExchangeRateStore", [&] {
            auto session = store_->openSession(ports::output::SessionMode::READ_ONLY);
            auto fromCode = requireCurrency(session->currencies(), from).code;
            auto toCode = requireCurrency(session->currencies(), to).code;
            return converter_->convert(session->exchangeRates(), amount, fromCode, toCode, at);
        });
    }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<settings::ILedgerSettings> settings_;
    std::shared_ptr<RateConverter> converter_;
};

} // namespace ledger::application
