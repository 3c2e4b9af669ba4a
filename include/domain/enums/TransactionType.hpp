#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Тип транзакции в журнале
 */
enum class TransactionType {
    BUY,
    SELL,
    TRANSFER,
    SWAP
};

inline std::string toString(TransactionType type) {
    switch (type) {
        case TransactionType::BUY:      return "buy";
        case TransactionType::SELL:     return "sell";
        case TransactionType::TRANSFER: return "transfer";
        case TransactionType::SWAP:     return "swap";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline TransactionType transactionTypeFromString(const std::string& str) {
    if (str == "buy")      return TransactionType::BUY;
    if (str == "sell")     return TransactionType::SELL;
    if (str == "transfer") return TransactionType::TRANSFER;
    if (str == "swap")     return TransactionType::SWAP;
    throw std::invalid_argument("Unknown TransactionType: " + str);
}

} // namespace ledger::domain
