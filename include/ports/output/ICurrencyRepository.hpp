#pragma once

#include "domain/Currency.hpp"
#include <string>
#include <optional>
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Интерфейс репозитория валют
 *
 * Output Port, привязан к транзакции сессии хранилища.
 */
class ICurrencyRepository {
public:
    virtual ~ICurrencyRepository() = default;

    /**
     * @brief Добавить валюту
     * @return false если код уже занят
     */
    virtual bool insert(const domain::Currency& currency) = 0;

    /**
     * @brief Найти валюту по коду (код уже в верхнем регистре)
     */
    virtual std::optional<domain::Currency> findByCode(const std::string& code) = 0;

    virtual std::vector<domain::Currency> findAll() = 0;

    /**
     * @brief Включить или отключить валюту
     * @return false если валюта не найдена
     */
    virtual bool setEnabled(const std::string& code, bool enabled) = 0;
};

} // namespace ledger::ports::output
