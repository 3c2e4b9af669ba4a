#pragma once

#include "enums/TransactionType.hpp"
#include "Decimal.hpp"
#include "Timestamp.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Запись журнала транзакций (неизменяема, только добавление)
 *
 * Buy заполняет сторону to*, Sell - сторону from*,
 * Transfer и Swap - обе стороны.
 */
struct TransactionRecord {
    int64_t id = 0;
    TransactionType type = TransactionType::BUY;

    std::optional<std::string> fromAccountId;
    std::optional<std::string> fromAsset;
    std::optional<Decimal> fromQuantity;

    std::optional<std::string> toAccountId;
    std::optional<std::string> toAsset;
    std::optional<Decimal> toQuantity;   ///< Для Transfer - полученное за вычетом комиссии

    std::optional<Decimal> unitPrice;
    std::optional<std::string> priceCurrency;
    std::optional<Decimal> fee;
    std::optional<std::string> feeAsset;
    std::optional<Decimal> exchangeRate; ///< Курс обмена (Swap)

    Timestamp timestamp;
    std::string notes;
};

} // namespace ledger::domain
