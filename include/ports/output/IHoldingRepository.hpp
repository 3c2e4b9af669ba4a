#pragma once

#include "domain/Holding.hpp"
#include <string>
#include <optional>
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Интерфейс репозитория позиций
 */
class IHoldingRepository {
public:
    virtual ~IHoldingRepository() = default;

    virtual std::optional<domain::Holding> find(
        const std::string& accountId,
        const std::string& asset
    ) = 0;

    /**
     * @brief Найти позицию и заблокировать строку до конца транзакции
     */
    virtual std::optional<domain::Holding> findForUpdate(
        const std::string& accountId,
        const std::string& asset
    ) = 0;

    virtual std::vector<domain::Holding> findByAccount(const std::string& accountId) = 0;

    virtual std::vector<domain::Holding> findAll() = 0;

    /**
     * @brief Вставить или обновить позицию по ключу (accountId, asset)
     */
    virtual void save(const domain::Holding& holding) = 0;

    /**
     * @return true если строка была удалена
     */
    virtual bool remove(const std::string& accountId, const std::string& asset) = 0;

    /**
     * @brief Удалить все позиции счёта
     * @return Количество удалённых строк
     */
    virtual size_t removeAll(const std::string& accountId) = 0;
};

} // namespace ledger::ports::output
