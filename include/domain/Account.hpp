#pragma once

#include "enums/AccountType.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Счёт, на котором лежат активы
 *
 * Создаётся и удаляется внешним инструментом, ядро только разрешает
 * его по имени или id.
 */
struct Account {
    std::string id;
    std::string name;
    AccountType accountType = AccountType::EXCHANGE;
    std::string category;   ///< Название категории ("Trading", "Cold Storage")
};

} // namespace ledger::domain
