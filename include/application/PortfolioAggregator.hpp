#pragma once

#include "ports/input/IPortfolioAggregator.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "ports/output/IAccountRegistry.hpp"
#include "settings/ILedgerSettings.hpp"
#include "application/RateConverter.hpp"
#include <memory>

namespace ledger::application {

/**
 * @brief Оценка портфеля (только чтение)
 *
 * Для каждой позиции с quantity > 0:
 *   value = quantity * price
 *   cost  = quantity * avgCostBasis (в валюте оценки)
 *   pnl   = value - cost, pnl% = pnl / cost * 100 (0 при cost == 0)
 *
 * Итоги по счетам, категориям и портфелю - суммы по позициям.
 * Позиция без цены учитывается в себестоимости, но не в стоимости.
 * Себестоимость в другой валюте пересчитывается по последнему курсу,
 * без курса она недоступна и не входит в итоги.
 */
class PortfolioAggregator : public ports::input::IPortfolioAggregator {
public:
    PortfolioAggregator(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<ports::output::IAccountRegistry> registry,
        std::shared_ptr<settings::ILedgerSettings> settings,
        std::shared_ptr<RateConverter> converter
    );

    domain::Result<domain::PortfolioValuation> valuate(
        const PriceLookup& prices,
        const std::optional<std::string>& account = std::nullopt
    ) override;

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<ports::output::IAccountRegistry> registry_;
    std::shared_ptr<settings::ILedgerSettings> settings_;
    std::shared_ptr<RateConverter> converter_;
};

} // namespace ledger::application
