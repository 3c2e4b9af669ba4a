#pragma once

#include "domain/ExchangeRate.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace ledger::ports::output {

/**
 * @brief Интерфейс репозитория курсов
 */
class IExchangeRateRepository {
public:
    virtual ~IExchangeRateRepository() = default;

    /**
     * @brief Вставить курс или заменить rate/source/notes существующего
     *        с тем же (from, to, timestamp)
     * @return id строки
     */
    virtual int64_t upsert(const domain::ExchangeRate& rate) = 0;

    /**
     * @brief Курс с максимальным timestamp для упорядоченной пары
     */
    virtual std::optional<domain::ExchangeRate> findLatest(
        const std::string& from,
        const std::string& to
    ) = 0;

    /**
     * @brief Последний курс с timestamp <= at
     */
    virtual std::optional<domain::ExchangeRate> findAsOf(
        const std::string& from,
        const std::string& to,
        const domain::Timestamp& at
    ) = 0;

    /**
     * @brief Страница истории по убыванию timestamp
     *
     * @param before Только курсы строго раньше этой метки (nullopt - с начала)
     * @param limit Размер страницы
     */
    virtual std::vector<domain::ExchangeRate> findPage(
        const std::string& from,
        const std::string& to,
        const std::optional<domain::Timestamp>& before,
        size_t limit
    ) = 0;
};

} // namespace ledger::ports::output
