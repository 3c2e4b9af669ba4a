#pragma once

#include "Decimal.hpp"
#include "Timestamp.hpp"
#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Курс обмена на момент времени
 *
 * rate = сколько единиц toCurrency стоит одна единица fromCurrency.
 * Обратный курс (1/rate) не хранится, а вычисляется.
 */
struct ExchangeRate {
    int64_t id = 0;
    std::string fromCurrency;
    std::string toCurrency;
    Decimal rate;
    Timestamp timestamp;
    std::string source = "manual";  ///< "manual", "swap", "api"
    std::string notes;

    /**
     * @brief Пересчитать сумму из fromCurrency в toCurrency
     */
    Decimal convert(const Decimal& amount) const {
        return amount * rate;
    }

    /**
     * @brief Обратный курс (to → from)
     * @throws std::domain_error если rate == 0
     */
    Decimal inverse() const {
        return Decimal::one() / rate;
    }
};

} // namespace ledger::domain
