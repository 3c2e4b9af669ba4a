#pragma once

#include "Holding.hpp"
#include <optional>

namespace ledger::domain {

/**
 * @brief Состояние позиции после изменения
 */
struct HoldingSnapshot {
    Holding holding;                     ///< Позиция после изменения
    Decimal previousQuantity;
    Decimal previousAvgCost;
    std::optional<Decimal> realizedPnl;  ///< Справочно, только при уменьшении с ценой
};

} // namespace ledger::domain
