#pragma once

#include "domain/LedgerError.hpp"
#include "domain/Currency.hpp"
#include "domain/Account.hpp"
#include "ports/output/ICurrencyRepository.hpp"
#include "ports/output/IAccountRegistry.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace ledger::application {

/**
 * @brief Код валюты в верхнем регистре без пробелов по краям
 */
inline std::string normalizeCode(const std::string& code) {
    auto first = std::find_if_not(code.begin(), code.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(code.rbegin(), code.rend(),
                                 [](unsigned char c) { return std::isspace(c); }).base();
    std::string result = first < last ? std::string(first, last) : std::string();
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

/**
 * @brief 2-10 символов [A-Z0-9]
 */
inline bool isValidCode(const std::string& code) {
    if (code.size() < 2 || code.size() > 10) {
        return false;
    }
    return std::all_of(code.begin(), code.end(), [](unsigned char c) {
        return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
    });
}

/**
 * @throws domain::LedgerException(NOT_FOUND)
 */
inline domain::Currency requireCurrency(ports::output::ICurrencyRepository& currencies,
                                        const std::string& code) {
    auto normalized = normalizeCode(code);
    auto currency = currencies.findByCode(normalized);
    if (!currency) {
        throw domain::LedgerException(domain::ErrorCode::NOT_FOUND,
                                      "Unknown currency: " + normalized);
    }
    return *currency;
}

/**
 * @throws domain::LedgerException(NOT_FOUND)
 */
inline domain::Account requireAccount(ports::output::IAccountRegistry& registry,
                                      const std::string& nameOrId) {
    auto account = registry.resolve(nameOrId);
    if (!account) {
        throw domain::LedgerException(domain::ErrorCode::NOT_FOUND,
                                      "Account not found: " + nameOrId);
    }
    return *account;
}

} // namespace ledger::application
