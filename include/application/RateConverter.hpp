#pragma once

#include "ports/output/IExchangeRateRepository.hpp"
#include "settings/ILedgerSettings.hpp"
#include "domain/LedgerError.hpp"
#include <memory>
#include <optional>
#include <string>

namespace ledger::application {

/**
 * @brief Пересчёт сумм между валютами по истории курсов
 *
 * Сначала прямой курс (from → to), затем обратный (to → from, 1/rate).
 * Курс старше LEDGER_RATE_MAX_AGE_HOURS относительно момента пересчёта
 * не используется (0 - без ограничения).
 */
class RateConverter {
public:
    explicit RateConverter(std::shared_ptr<settings::ILedgerSettings> settings)
        : maxAgeHours_(settings->getRateMaxAgeHours())
    {}

    /**
     * @brief Множитель from → to на момент at или nullopt
     */
    std::optional<domain::Decimal> findRate(
        ports::output::IExchangeRateRepository& rates,
        const std::string& from,
        const std::string& to,
        const domain::Timestamp& at
    ) const {
        if (from == to) {
            return domain::Decimal::one();
        }
        auto direct = rates.findAsOf(from, to, at);
        if (direct && isFresh(*direct, at)) {
            return direct->rate;
        }
        auto inverse = rates.findAsOf(to, from, at);
        if (inverse && isFresh(*inverse, at)) {
            return inverse->inverse();
        }
        return std::nullopt;
    }

    /**
     * @brief Пересчитать сумму
     * @throws domain::LedgerException(RATE_UNAVAILABLE)
     */
    domain::Decimal convert(
        ports::output::IExchangeRateRepository& rates,
        const domain::Decimal& amount,
        const std::string& from,
        const std::string& to,
        const domain::Timestamp& at
    ) const {
        auto rate = findRate(rates, from, to, at);
        if (!rate) {
            throw domain::LedgerException(
                domain::ErrorCode::RATE_UNAVAILABLE,
                "No exchange rate " + from + "/" + to + " as of " + at.toString());
        }
        return amount * *rate;
    }

    /**
     * @brief Последний известный множитель from → to без учёта возраста
     */
    std::optional<domain::Decimal> latestRate(
        ports::output::IExchangeRateRepository& rates,
        const std::string& from,
        const std::string& to
    ) const {
        if (from == to) {
            return domain::Decimal::one();
        }
        if (auto direct = rates.findLatest(from, to)) {
            return direct->rate;
        }
        if (auto inverse = rates.findLatest(to, from)) {
            return inverse->inverse();
        }
        return std::nullopt;
    }

    int maxAgeHours() const { return maxAgeHours_; }

private:
    int maxAgeHours_;

    bool isFresh(const domain::ExchangeRate& rate, const domain::Timestamp& at) const {
        if (maxAgeHours_ <= 0) {
            return true;
        }
        return rate.timestamp >= at.addHours(-maxAgeHours_);
    }
};

} // namespace ledger::application
