#pragma once

#include <string>
#include <optional>
#include <algorithm>
#include <cctype>

namespace ledger::domain {

/**
 * @brief Класс актива в каталоге валют
 */
enum class AssetClass {
    FIAT,       ///< Государственная валюта (USD, CRC, EUR)
    STABLECOIN, ///< Криптоактив с привязкой к фиату (USDT, USDC)
    CRYPTO      ///< Криптовалюта (BTC, ETH)
};

/**
 * @brief Преобразовать в строку (значение колонки asset_class)
 */
inline std::string toString(AssetClass assetClass) {
    switch (assetClass) {
        case AssetClass::FIAT:       return "fiat";
        case AssetClass::STABLECOIN: return "stablecoin";
        case AssetClass::CRYPTO:     return "crypto";
    }
    return "crypto";
}

/**
 * @brief Создать из строки
 *
 * Принимает синонимы: "cryptocurrency", "stable". Регистр не важен.
 */
inline std::optional<AssetClass> assetClassFromString(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "fiat") return AssetClass::FIAT;
    if (lower == "crypto" || lower == "cryptocurrency") return AssetClass::CRYPTO;
    if (lower == "stablecoin" || lower == "stable") return AssetClass::STABLECOIN;
    return std::nullopt;
}

/**
 * @brief Порядок в списках: Fiat → Stablecoin → Crypto
 */
inline int sortOrder(AssetClass assetClass) {
    switch (assetClass) {
        case AssetClass::FIAT:       return 1;
        case AssetClass::STABLECOIN: return 2;
        case AssetClass::CRYPTO:     return 3;
    }
    return 3;
}

/**
 * @brief Человекочитаемое название
 */
inline std::string getDisplayName(AssetClass assetClass) {
    switch (assetClass) {
        case AssetClass::FIAT:       return "Fiat";
        case AssetClass::STABLECOIN: return "Stablecoin";
        case AssetClass::CRYPTO:     return "Cryptocurrency";
    }
    return "Unknown";
}

} // namespace ledger::domain
