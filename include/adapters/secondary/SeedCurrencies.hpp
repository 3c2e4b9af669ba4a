#pragma once

#include "domain/Currency.hpp"
#include <vector>

namespace ledger::adapters::secondary {

/**
 * @brief Валюты, создаваемые вместе со схемой
 */
inline std::vector<domain::Currency> seedCurrencies() {
    using domain::AssetClass;
    return {
        {"USD",  "US Dollar",          "$",    2,  AssetClass::FIAT},
        {"CRC",  "Costa Rican Colón",  "₡",    2,  AssetClass::FIAT},
        {"EUR",  "Euro",               "€",    2,  AssetClass::FIAT},
        {"BTC",  "Bitcoin",            "₿",    8,  AssetClass::CRYPTO},
        {"ETH",  "Ethereum",           "Ξ",    18, AssetClass::CRYPTO},
        {"USDT", "Tether USD",         "USDT", 6,  AssetClass::STABLECOIN},
        {"USDC", "USD Coin",           "USDC", 6,  AssetClass::STABLECOIN},
        {"BNB",  "Binance Coin",       "BNB",  8,  AssetClass::CRYPTO},
        {"SOL",  "Solana",             "SOL",  9,  AssetClass::CRYPTO},
    };
}

} // namespace ledger::adapters::secondary
