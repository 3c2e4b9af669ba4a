#pragma once

#include "domain/Account.hpp"
#include <string>
#include <optional>
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Внешний реестр счетов
 *
 * Создание и удаление счетов выполняется вне ядра.
 */
class IAccountRegistry {
public:
    virtual ~IAccountRegistry() = default;

    /**
     * @brief Найти счёт по имени или id
     */
    virtual std::optional<domain::Account> resolve(const std::string& nameOrId) = 0;

    virtual std::vector<domain::Account> findAll() = 0;
};

} // namespace ledger::ports::output
