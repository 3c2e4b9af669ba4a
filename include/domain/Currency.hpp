#pragma once

#include "enums/AssetClass.hpp"
#include "Decimal.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Валюта или актив в каталоге
 *
 * code уникален и неизменяем. Валюты не удаляются, только отключаются.
 */
struct Currency {
    std::string code;             ///< "USD", "BTC" (2-10 символов [A-Z0-9])
    std::string displayName;      ///< "US Dollar"
    std::string symbol;           ///< "$", "₿"
    int decimalPrecision = 2;     ///< Знаков при отображении (0..18)
    AssetClass assetClass = AssetClass::FIAT;
    bool enabled = true;

    Currency() = default;

    Currency(std::string code_, std::string name, std::string symbol_,
             int precision, AssetClass cls, bool enabled_ = true)
        : code(std::move(code_))
        , displayName(std::move(name))
        , symbol(std::move(symbol_))
        , decimalPrecision(precision)
        , assetClass(cls)
        , enabled(enabled_)
    {}

    bool isFiat() const { return assetClass == AssetClass::FIAT; }

    /**
     * @brief Отформатировать сумму с символом и точностью валюты ("$1234.57")
     */
    std::string formatAmount(const Decimal& amount) const {
        std::string digits = amount.toFixed(decimalPrecision);
        if (!digits.empty() && digits[0] == '-') {
            return "-" + symbol + digits.substr(1);
        }
        return symbol + digits;
    }
};

} // namespace ledger::domain
