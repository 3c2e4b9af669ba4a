#pragma once

#include "TransactionRecord.hpp"
#include "HoldingSnapshot.hpp"
#include "ExchangeRate.hpp"
#include <vector>
#include <optional>

namespace ledger::domain {

/**
 * @brief Результат записи транзакции
 */
struct TransactionResult {
    TransactionRecord record;
    std::vector<HoldingSnapshot> legs;           ///< Позиции после применения, в порядке применения
    std::optional<Decimal> realizedPnl;          ///< Справочный P&L (Sell, комиссия Transfer)
    std::optional<ExchangeRate> capturedRate;    ///< Курс, записанный фиат-фиат обменом
};

} // namespace ledger::domain
