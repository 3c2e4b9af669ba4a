#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Тип счёта (где физически лежат активы)
 */
enum class AccountType {
    EXCHANGE,
    HARDWARE_WALLET,
    SOFTWARE_WALLET,
    CUSTODIAL_SERVICE,
    BANK
};

/**
 * @brief Преобразовать в строку
 */
inline std::string toString(AccountType type) {
    switch (type) {
        case AccountType::EXCHANGE:          return "exchange";
        case AccountType::HARDWARE_WALLET:   return "hardware_wallet";
        case AccountType::SOFTWARE_WALLET:   return "software_wallet";
        case AccountType::CUSTODIAL_SERVICE: return "custodial_service";
        case AccountType::BANK:              return "bank";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline AccountType accountTypeFromString(const std::string& str) {
    if (str == "exchange")          return AccountType::EXCHANGE;
    if (str == "hardware_wallet")   return AccountType::HARDWARE_WALLET;
    if (str == "software_wallet")   return AccountType::SOFTWARE_WALLET;
    if (str == "custodial_service") return AccountType::CUSTODIAL_SERVICE;
    if (str == "bank")              return AccountType::BANK;
    throw std::invalid_argument("Unknown AccountType: " + str);
}

} // namespace ledger::domain
