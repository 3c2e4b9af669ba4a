#pragma once

#include "Decimal.hpp"
#include "Timestamp.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Позиция по активу на счёте
 *
 * Ключ - (accountId, asset). При нулевом количестве строка сохраняется,
 * avgCostBasis при этом не имеет смысла.
 */
struct Holding {
    std::string accountId;
    std::string asset;
    Decimal quantity;
    Decimal avgCostBasis;            ///< Средняя цена единицы в costBasisCurrency
    std::string costBasisCurrency;
    Timestamp updatedAt;

    /**
     * @brief Суммарная стоимость покупки (quantity * avgCostBasis)
     */
    Decimal totalCost() const {
        return quantity * avgCostBasis;
    }

    bool isEmpty() const {
        return quantity.isZero();
    }
};

} // namespace ledger::domain
