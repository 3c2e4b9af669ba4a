#pragma once

#include "domain/Currency.hpp"
#include "domain/Result.hpp"
#include <string>
#include <optional>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Каталог валют (Input Port)
 */
class ICurrencyCatalog {
public:
    virtual ~ICurrencyCatalog() = default;

    /**
     * @brief Зарегистрировать валюту
     *
     * ALREADY_EXISTS если код занят, INVALID_INPUT при неверном коде,
     * пустом названии или точности вне 0..18.
     */
    virtual domain::Result<domain::Currency> registerCurrency(const domain::Currency& currency) = 0;

    /**
     * @brief Найти валюту (регистр кода не важен)
     */
    virtual domain::Result<domain::Currency> get(const std::string& code) = 0;

    /**
     * @brief Список валют: Fiat → Stablecoin → Crypto, затем по коду
     */
    virtual domain::Result<std::vector<domain::Currency>> list(
        std::optional<domain::AssetClass> assetClass,
        bool enabledOnly
    ) = 0;

    /**
     * @brief Включить / отключить валюту (идемпотентно)
     */
    virtual domain::Result<domain::Unit> setEnabled(const std::string& code, bool enabled) = 0;

    /**
     * @brief Символ + сумма, округлённая до точности валюты
     */
    virtual domain::Result<std::string> format(const std::string& code, const domain::Decimal& amount) = 0;
};

} // namespace ledger::ports::input
