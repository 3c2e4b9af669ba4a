#pragma once

#include "domain/ExchangeRate.hpp"
#include "domain/RateHistory.hpp"
#include "domain/Result.hpp"
#include <string>
#include <cstdint>

namespace ledger::ports::input {

/**
 * @brief История курсов обмена (Input Port)
 */
class IExchangeRateStore {
public:
    virtual ~IExchangeRateStore() = default;

    /**
     * @brief Записать курс (повторная запись с тем же (from, to, timestamp) заменяет значение)
     * @return id строки
     */
    virtual domain::Result<int64_t> upsert(const domain::ExchangeRate& rate) = 0;

    /**
     * @brief Последний курс упорядоченной пары, обратный не вычисляется
     */
    virtual domain::Result<domain::ExchangeRate> latest(
        const std::string& from,
        const std::string& to
    ) = 0;

    /**
     * @brief Последний курс не позже указанного момента
     */
    virtual domain::Result<domain::ExchangeRate> asOf(
        const std::string& from,
        const std::string& to,
        const domain::Timestamp& at
    ) = 0;

    /**
     * @brief Ленивая история пары, новые первыми
     */
    virtual domain::Result<domain::RateHistory> history(
        const std::string& from,
        const std::string& to
    ) = 0;

    /**
     * @brief Пересчитать сумму по прямому или обратному курсу на момент at
     */
    virtual domain::Result<domain::Decimal> convert(
        const domain::Decimal& amount,
        const std::string& from,
        const std::string& to,
        const domain::Timestamp& at
    ) = 0;
};

} // namespace ledger::ports::input
