#pragma once

#include "ICurrencyRepository.hpp"
#include "IExchangeRateRepository.hpp"
#include "IHoldingRepository.hpp"
#include "ITransactionRepository.hpp"
#include <memory>

namespace ledger::ports::output {

/**
 * @brief Режим сессии хранилища
 */
enum class SessionMode {
    READ_ONLY,     ///< Снимок для чтения, изменения запрещены
    SERIALIZABLE   ///< Запись, уровень изоляции SERIALIZABLE
};

/**
 * @brief Единица работы с хранилищем
 *
 * Все репозитории сессии работают в одной транзакции.
 * Деструктор без commit() откатывает изменения.
 */
class ILedgerSession {
public:
    virtual ~ILedgerSession() = default;

    virtual ICurrencyRepository& currencies() = 0;
    virtual IExchangeRateRepository& exchangeRates() = 0;
    virtual IHoldingRepository& holdings() = 0;
    virtual ITransactionRepository& transactions() = 0;

    /**
     * @brief Зафиксировать транзакцию
     * @throws domain::LedgerException(CONFLICT) при ошибке сериализации
     */
    virtual void commit() = 0;
};

/**
 * @brief Хранилище ledger (Output Port)
 */
class ILedgerStore {
public:
    virtual ~ILedgerStore() = default;

    virtual std::unique_ptr<ILedgerSession> openSession(SessionMode mode) = 0;
};

} // namespace ledger::ports::output
