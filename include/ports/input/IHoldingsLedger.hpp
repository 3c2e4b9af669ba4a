#pragma once

#include "domain/HoldingSnapshot.hpp"
#include "domain/Result.hpp"
#include <string>
#include <optional>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Позиции со средневзвешенной себестоимостью (Input Port)
 */
class IHoldingsLedger {
public:
    virtual ~IHoldingsLedger() = default;

    /**
     * @brief Изменить количество актива на счёте
     *
     * @param account Имя или id счёта
     * @param asset Код актива
     * @param quantityDelta Ненулевое изменение количества
     * @param unitPrice Цена единицы (для увеличения пересчитывает среднюю)
     * @param priceCurrency Валюта цены
     */
    virtual domain::Result<domain::HoldingSnapshot> apply(
        const std::string& account,
        const std::string& asset,
        const domain::Decimal& quantityDelta,
        const std::optional<domain::Decimal>& unitPrice,
        const std::optional<std::string>& priceCurrency
    ) = 0;

    virtual domain::Result<domain::Holding> get(
        const std::string& account,
        const std::string& asset
    ) = 0;

    /**
     * @brief Позиции счёта или все позиции (включая нулевые)
     */
    virtual domain::Result<std::vector<domain::Holding>> list(
        const std::optional<std::string>& account
    ) = 0;

    /**
     * @brief Явно удалить строку позиции
     */
    virtual domain::Result<domain::Unit> remove(
        const std::string& account,
        const std::string& asset
    ) = 0;

    /**
     * @brief Удалить все позиции счёта
     * @return Количество удалённых строк
     */
    virtual domain::Result<size_t> removeAccount(const std::string& account) = 0;
};

} // namespace ledger::ports::input
