#pragma once

#include "Decimal.hpp"
#include "Timestamp.hpp"
#include <string>
#include <optional>
#include <variant>

namespace ledger::domain {

/**
 * @brief Покупка актива на счёт
 */
struct BuyRequest {
    std::string account;                       ///< Имя или id счёта
    std::string asset;
    Decimal quantity;
    Decimal unitPrice;
    std::optional<std::string> priceCurrency;  ///< По умолчанию - валюта себестоимости
};

/**
 * @brief Продажа актива со счёта
 */
struct SellRequest {
    std::string account;
    std::string asset;
    Decimal quantity;
    Decimal unitPrice;
    std::optional<std::string> priceCurrency;
};

/**
 * @brief Перевод актива между счетами
 *
 * Комиссия уменьшает полученное количество.
 */
struct TransferRequest {
    std::string fromAccount;
    std::string toAccount;
    std::string asset;
    Decimal quantity;
    Decimal fee;
};

/**
 * @brief Обмен одного актива на другой
 */
struct SwapRequest {
    std::string fromAccount;
    std::string fromAsset;
    Decimal fromQuantity;
    std::string toAccount;
    std::string toAsset;
    Decimal toQuantity;
    std::optional<Decimal> manualRate;  ///< Цена единицы toAsset в fromAsset
};

using TransactionKind = std::variant<BuyRequest, SellRequest, TransferRequest, SwapRequest>;

/**
 * @brief Запрос на запись транзакции
 */
struct TransactionRequest {
    TransactionKind kind;
    std::optional<Timestamp> timestamp;    ///< По умолчанию - текущее время
    std::optional<std::string> feeAsset;   ///< По умолчанию - переводимый актив
    std::string notes;

    TransactionRequest() = default;

    explicit TransactionRequest(TransactionKind k)
        : kind(std::move(k))
    {}
};

} // namespace ledger::domain
