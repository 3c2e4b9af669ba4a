#pragma once

#include "Holding.hpp"
#include <string>
#include <vector>
#include <optional>

namespace ledger::domain {

/**
 * @brief Оценка одной позиции
 *
 * Поля без значения означают, что цена или курс недоступны.
 */
struct HoldingValuation {
    Holding holding;
    std::string accountName;
    std::string category;
    std::optional<Decimal> price;
    std::optional<Decimal> value;          ///< quantity * price
    std::optional<Decimal> cost;           ///< quantity * avgCostBasis в валюте оценки
    std::optional<Decimal> unrealizedPnl;  ///< value - cost
    std::optional<Decimal> pnlPercent;     ///< 0 при нулевой себестоимости
};

struct AccountValuation {
    std::string accountId;
    std::string accountName;
    std::string category;
    std::vector<HoldingValuation> holdings;
    Decimal totalValue;
    Decimal totalCost;
    Decimal unrealizedPnl;
};

struct CategoryValuation {
    std::string category;
    std::vector<AccountValuation> accounts;
    Decimal totalValue;
    Decimal totalCost;
    Decimal unrealizedPnl;
};

/**
 * @brief Итог по активу на всех счетах
 */
struct AssetTotal {
    std::string asset;
    Decimal quantity;
    std::optional<Decimal> value;
};

struct PortfolioValuation {
    std::string valuationCurrency;
    std::vector<CategoryValuation> categories;  ///< По убыванию стоимости
    std::vector<AssetTotal> assets;
    Decimal totalValue;
    Decimal totalCost;
    Decimal unrealizedPnl;
    Decimal pnlPercent;

    bool isEmpty() const {
        return categories.empty();
    }
};

} // namespace ledger::domain
