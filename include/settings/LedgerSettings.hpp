#pragma once

#include "settings/ILedgerSettings.hpp"
#include <cstdlib>
#include <string>
#include <algorithm>
#include <cctype>

namespace ledger::settings {

class LedgerSettings : public ILedgerSettings {
public:
    std::string getStorage() const override {
        const char* storage = std::getenv("LEDGER_STORAGE");
        return storage ? storage : "postgres";
    }

    std::string getBaseCurrency() const override {
        const char* code = std::getenv("LEDGER_BASE_CURRENCY");
        std::string result = code ? code : "USD";
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return result;
    }

    int getRateMaxAgeHours() const override {
        const char* hours = std::getenv("LEDGER_RATE_MAX_AGE_HOURS");
        return hours ? std::stoi(hours) : 0;
    }

    size_t getHistoryPageSize() const override {
        const char* size = std::getenv("LEDGER_HISTORY_PAGE_SIZE");
        return size ? static_cast<size_t>(std::stoul(size)) : 100;
    }

    std::string getPricesFile() const override {
        const char* path = std::getenv("LEDGER_PRICES_FILE");
        return path ? path : "prices.json";
    }

    std::string getMemoryAccounts() const override {
        const char* accounts = std::getenv("LEDGER_MEMORY_ACCOUNTS");
        return accounts ? accounts : "";
    }
};

} // namespace ledger::settings
