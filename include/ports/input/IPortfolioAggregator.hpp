#pragma once

#include "domain/Valuation.hpp"
#include "domain/Result.hpp"
#include <functional>
#include <optional>
#include <string>

namespace ledger::ports::input {

/**
 * @brief Оценка портфеля по ценам, переданным вызывающим кодом (Input Port)
 */
class IPortfolioAggregator {
public:
    using PriceLookup = std::function<std::optional<domain::Decimal>(const std::string& asset)>;

    virtual ~IPortfolioAggregator() = default;

    /**
     * @param prices Цена актива в валюте оценки или nullopt
     * @param account Ограничить одним счётом (имя или id)
     */
    virtual domain::Result<domain::PortfolioValuation> valuate(
        const PriceLookup& prices,
        const std::optional<std::string>& account = std::nullopt
    ) = 0;
};

} // namespace ledger::ports::input
