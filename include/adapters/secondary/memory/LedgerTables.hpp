#pragma once

#include "domain/Currency.hpp"
#include "domain/ExchangeRate.hpp"
#include "domain/Holding.hpp"
#include "domain/TransactionRecord.hpp"
#include <map>
#include <string>
#include <tuple>
#include <utility>
#include <vector>
#include <cstdint>

namespace ledger::adapters::secondary::memory {

/**
 * @brief Таблицы in-memory хранилища
 *
 * Копируются целиком при открытии пишущей сессии и подменяются при commit.
 */
struct LedgerTables {
    using RateKey = std::tuple<std::string, std::string, int64_t>;   ///< (from, to, micros)
    using HoldingKey = std::pair<std::string, std::string>;         ///< (accountId, asset)

    std::map<std::string, domain::Currency> currencies;
    std::map<RateKey, domain::ExchangeRate> rates;
    std::map<HoldingKey, domain::Holding> holdings;
    std::vector<domain::TransactionRecord> transactions;  ///< id = индекс + 1
    int64_t nextRateId = 1;
};

} // namespace ledger::adapters::secondary::memory
