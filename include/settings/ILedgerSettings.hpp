#pragma once

#include <string>

namespace ledger::settings {

/**
 * @brief Настройки ядра учёта
 */
class ILedgerSettings {
public:
    virtual ~ILedgerSettings() = default;

    /**
     * @brief "postgres" или "memory"
     */
    virtual std::string getStorage() const = 0;

    /**
     * @brief Валюта себестоимости по умолчанию и валюта оценки портфеля
     */
    virtual std::string getBaseCurrency() const = 0;

    /**
     * @brief Максимальный возраст курса для конвертации, 0 - без ограничения
     */
    virtual int getRateMaxAgeHours() const = 0;

    virtual size_t getHistoryPageSize() const = 0;

    /**
     * @brief JSON-файл с текущими ценами для команды portfolio
     */
    virtual std::string getPricesFile() const = 0;

    /**
     * @brief Счета для режима memory: "name[:category],..."
     */
    virtual std::string getMemoryAccounts() const = 0;
};

} // namespace ledger::settings
