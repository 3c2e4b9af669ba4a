#pragma once

#include "domain/Decimal.hpp"
#include <string>
#include <optional>

namespace ledger::ports::output {

/**
 * @brief Источник текущих цен активов
 *
 * Ядро не выбирает цену само: вызывающий код передаёт её в PortfolioAggregator.
 */
class IPriceFeed {
public:
    virtual ~IPriceFeed() = default;

    /**
     * @return Цена в валюте оценки или nullopt если недоступна
     */
    virtual std::optional<domain::Decimal> currentPrice(const std::string& asset) = 0;
};

} // namespace ledger::ports::output
